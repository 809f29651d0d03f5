#pragma once

#include "common.hpp"
#include "errors.hpp"

#include <array>
#include <set>
#include <string>

namespace regsnap
{
    // Closed set of registry entity kinds. Codes are persisted in log segments and
    // export partitions and must never be renumbered.
    enum class EntityKind : std::uint32_t
    {
        Registry = 1,
        Registrar = 2,
        RegistrarContact = 3,
        DomainBase = 4,
        ContactResource = 5,
        HostResource = 6,
        HistoryEntry = 7,
        BillingEvent = 8,
        PremiumList = 9,
        ReservedList = 10,
        AllocationToken = 11,
        Cursor = 12,
    };

    inline constexpr std::array<EntityKind, 12> kAllEntityKinds = {
        EntityKind::Registry,
        EntityKind::Registrar,
        EntityKind::RegistrarContact,
        EntityKind::DomainBase,
        EntityKind::ContactResource,
        EntityKind::HostResource,
        EntityKind::HistoryEntry,
        EntityKind::BillingEvent,
        EntityKind::PremiumList,
        EntityKind::ReservedList,
        EntityKind::AllocationToken,
        EntityKind::Cursor,
    };

    using KindSet = std::set<EntityKind>;

    inline constexpr std::uint32_t kind_code(EntityKind k) noexcept
    {
        return static_cast<std::uint32_t>(k);
    }

    inline const char *kind_name(EntityKind k) noexcept
    {
        switch (k)
        {
        case EntityKind::Registry:
            return "Registry";
        case EntityKind::Registrar:
            return "Registrar";
        case EntityKind::RegistrarContact:
            return "RegistrarContact";
        case EntityKind::DomainBase:
            return "DomainBase";
        case EntityKind::ContactResource:
            return "ContactResource";
        case EntityKind::HostResource:
            return "HostResource";
        case EntityKind::HistoryEntry:
            return "HistoryEntry";
        case EntityKind::BillingEvent:
            return "BillingEvent";
        case EntityKind::PremiumList:
            return "PremiumList";
        case EntityKind::ReservedList:
            return "ReservedList";
        case EntityKind::AllocationToken:
            return "AllocationToken";
        case EntityKind::Cursor:
            return "Cursor";
        }
        return "Unknown";
    }

    inline std::optional<EntityKind> kind_from_code(std::uint32_t code) noexcept
    {
        for (const EntityKind k : kAllEntityKinds)
        {
            if (kind_code(k) == code)
            {
                return k;
            }
        }
        return std::nullopt;
    }

    inline std::optional<EntityKind> kind_from_name(std::string_view name) noexcept
    {
        for (const EntityKind k : kAllEntityKinds)
        {
            if (name == kind_name(k))
            {
                return k;
            }
        }
        return std::nullopt;
    }

    inline EntityKind require_kind(std::string_view name)
    {
        auto k = kind_from_name(name);
        if (!k)
        {
            throw UnknownKindError("unknown entity kind: " + std::string(name));
        }
        return *k;
    }

    // Parses "DomainBase,Registry,..." into a tracked-kind set.
    inline KindSet parse_kind_list(std::string_view csv)
    {
        KindSet out;
        while (!csv.empty())
        {
            const auto comma = csv.find(',');
            const auto item = csv.substr(0, comma);
            if (!item.empty())
            {
                out.insert(require_kind(item));
            }
            if (comma == std::string_view::npos)
            {
                break;
            }
            csv.remove_prefix(comma + 1);
        }
        return out;
    }

    struct EntityKey
    {
        EntityKind kind = EntityKind::Registry;
        EntityIdString id;

        friend bool operator==(const EntityKey &, const EntityKey &) = default;
        friend bool operator<(const EntityKey &a, const EntityKey &b)
        {
            if (a.kind != b.kind)
            {
                return kind_code(a.kind) < kind_code(b.kind);
            }
            return a.id < b.id;
        }
    };
}
