/*
Purpose: Tests the snapshot output surface and its use as a later baseline.

What this tests: find/table/kinds lookups; merge_disjoint rejects overlapping keys;
write_snapshot emits the export layout (skipping tombstones) so that a reconstruction
seeded from it over an empty log window reproduces the same snapshot; encode/decode
preserves content exactly.
*/

#include "replay_engine.hpp"

#include <cassert>
#include <filesystem>

namespace
{
    using regsnap::EntityKind;

    regsnap::MaterializedEntity entity(EntityKind kind, const std::string &id, regsnap::CommitTime ts, std::optional<std::string> payload)
    {
        regsnap::MaterializedEntity e;
        e.kind = kind;
        e.entityId = id;
        e.effectiveTimestamp = ts;
        if (payload)
        {
            e.payload = regsnap::bytes_from_string(*payload);
        }
        return e;
    }
}

int main()
{
    namespace fs = std::filesystem;
    const fs::path dir = fs::temp_directory_path() / "regsnap_snapshot_output_test";
    fs::remove_all(dir);

    const regsnap::KindSet kinds = {EntityKind::Registry, EntityKind::PremiumList, EntityKind::ReservedList};
    const regsnap::TimeWindow window{100, 500};

    regsnap::Snapshot snap(window, kinds);
    snap.put(entity(EntityKind::Registry, "tld", 400, "registry"));
    snap.put(entity(EntityKind::PremiumList, "premium", 300, "premium"));
    snap.put(entity(EntityKind::PremiumList, "legacy", regsnap::kBeginningOfTime, "no date"));
    snap.put(entity(EntityKind::ReservedList, "reserved", 450, std::nullopt));

    assert(snap.as_of() == 500);
    assert(snap.size() == 4);
    assert(snap.table(EntityKind::PremiumList).size() == 2);
    assert(snap.table(EntityKind::Cursor).empty());
    assert(snap.find(EntityKind::Registry, "missing") == nullptr);
    assert(snap.find(EntityKind::ReservedList, "reserved")->absent());
    assert((snap.kinds() == std::vector<EntityKind>{EntityKind::Registry, EntityKind::PremiumList, EntityKind::ReservedList}));

    const auto encoded = snap.encode();
    const auto decoded = regsnap::Snapshot::decode(std::span<const std::byte>(encoded.data(), encoded.size()));
    assert(decoded.encode() == encoded);
    assert(decoded.window() == window);
    assert(decoded.tracked_kinds() == kinds);

    // Overlapping partitions are a bug.
    {
        regsnap::Snapshot a(window, kinds);
        a.put(entity(EntityKind::Registry, "tld", 1, "a"));
        regsnap::Snapshot b(window, kinds);
        b.put(entity(EntityKind::Registry, "tld", 2, "b"));
        bool threw = false;
        try
        {
            a.merge_disjoint(std::move(b));
        }
        catch (const std::logic_error &)
        {
            threw = true;
        }
        assert(threw);
    }

    // Written snapshot seeds a later reconstruction.
    assert(regsnap::write_snapshot(dir, snap) == 3);

    regsnap::DirectoryExportReader reader(dir);
    assert(reader.manifest()->exportCompletion == 500);

    regsnap::CommitLogStore log(regsnap::CommitLogStoreConfig{.origin = 500});
    regsnap::ReplayEngine engine;
    const auto restored = engine.reconstruct(reader, log, regsnap::TimeWindow{500, 500}, kinds);

    regsnap::Snapshot expected = regsnap::Snapshot::decode(std::span<const std::byte>(encoded.data(), encoded.size()));
    expected.drop_absent();
    assert(restored.size() == 3);
    assert(restored.digest() == expected.digest());
    assert(restored.find(EntityKind::PremiumList, "legacy")->effectiveTimestamp == regsnap::kBeginningOfTime);

    fs::remove_all(dir);
    return 0;
}
