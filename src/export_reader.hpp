#pragma once

#include "entity_kind.hpp"
#include "log.hpp"
#include "record_file.hpp"

#include <filesystem>
#include <map>
#include <memory>

namespace regsnap
{
    // Best-known state of one entity as captured by a non-atomic export.
    struct ExportRecord
    {
        EntityKind kind = EntityKind::Registry;
        EntityIdString entityId;
        ByteBuffer payload;
        std::optional<CommitTime> knownAsOfTimestamp;

        friend bool operator==(const ExportRecord &, const ExportRecord &) = default;
    };

    // The export ran over [exportStart, exportCompletion); no record is newer than
    // exportCompletion but any record may be older than exportStart.
    struct ExportManifest
    {
        CommitTime exportStart = kBeginningOfTime;
        CommitTime exportCompletion = kBeginningOfTime;
        KindSet kinds;
    };

    inline ByteBuffer encode_export_record(const ExportRecord &rec)
    {
        WireWriter w;
        w.write_u32(kind_code(rec.kind));
        w.write_string(rec.entityId);
        w.write_bytes(std::span<const std::byte>(rec.payload.data(), rec.payload.size()));
        w.write_u8(static_cast<std::uint8_t>(rec.knownAsOfTimestamp.has_value() ? 1 : 0));
        w.write_i64(rec.knownAsOfTimestamp.value_or(0));
        return w.take();
    }

    inline ExportRecord decode_export_record(std::span<const std::byte> bytes)
    {
        WireReader r(bytes);
        ExportRecord rec;
        const auto code = r.read_u32();
        const auto kind = kind_from_code(code);
        if (!kind)
        {
            throw std::runtime_error("decode_export_record: unknown kind code " + std::to_string(code));
        }
        rec.kind = *kind;
        rec.entityId = r.read_string();
        rec.payload = r.read_bytes();
        const bool hasKnownAsOf = r.read_u8() != 0;
        const CommitTime knownAsOf = r.read_i64();
        if (hasKnownAsOf)
        {
            rec.knownAsOfTimestamp = knownAsOf;
        }
        r.expect_end();
        return rec;
    }

    // Lazy, restartable pass over one kind's partition. Records come in no particular order.
    class IExportCursor
    {
    public:
        virtual ~IExportCursor() = default;
        virtual std::optional<ExportRecord> next() = 0;
        virtual void rewind() = 0;
    };

    class IExportSource
    {
    public:
        virtual ~IExportSource() = default;
        virtual std::unique_ptr<IExportCursor> read(EntityKind kind) const = 0;
        virtual std::optional<ExportManifest> manifest() const = 0;
    };

    class InMemoryExport final : public IExportSource
    {
    public:
        void add(ExportRecord rec)
        {
            const auto kind = rec.kind;
            m_partitions[kind].push_back(std::move(rec));
        }

        void set_manifest(ExportManifest m) { m_manifest = std::move(m); }

        std::unique_ptr<IExportCursor> read(EntityKind kind) const override
        {
            auto it = m_partitions.find(kind);
            if (it == m_partitions.end())
            {
                return std::make_unique<VectorCursor>(nullptr);
            }
            return std::make_unique<VectorCursor>(&it->second);
        }

        std::optional<ExportManifest> manifest() const override { return m_manifest; }

    private:
        class VectorCursor final : public IExportCursor
        {
        public:
            explicit VectorCursor(const std::vector<ExportRecord> *records) : m_records(records) {}

            std::optional<ExportRecord> next() override
            {
                if (!m_records || m_pos >= m_records->size())
                {
                    return std::nullopt;
                }
                return (*m_records)[m_pos++];
            }

            void rewind() override { m_pos = 0; }

        private:
            const std::vector<ExportRecord> *m_records = nullptr;
            std::size_t m_pos = 0;
        };

        std::map<EntityKind, std::vector<ExportRecord>> m_partitions;
        std::optional<ExportManifest> m_manifest;
    };

    inline constexpr std::string_view kExportManifestFile = "export_manifest";
    inline constexpr std::string_view kExportPartitionSuffix = ".export";

    inline std::filesystem::path export_partition_path(const std::filesystem::path &dir, EntityKind kind)
    {
        return dir / (std::string(kind_name(kind)) + std::string(kExportPartitionSuffix));
    }

    // Reads <dir>/<KindName>.export partitions and <dir>/export_manifest.
    class DirectoryExportReader final : public IExportSource
    {
    public:
        explicit DirectoryExportReader(std::filesystem::path dir) : m_dir(std::move(dir))
        {
            if (!std::filesystem::is_directory(m_dir))
            {
                throw std::runtime_error("DirectoryExportReader: not a directory: " + m_dir.string());
            }
            const auto manifestPath = m_dir / kExportManifestFile;
            if (std::filesystem::exists(manifestPath))
            {
                m_manifest = load_manifest_(manifestPath);
            }
        }

        std::unique_ptr<IExportCursor> read(EntityKind kind) const override
        {
            const auto path = export_partition_path(m_dir, kind);
            if (!std::filesystem::exists(path))
            {
                // The writer creates a partition for every manifest kind, even when empty.
                if (m_manifest && m_manifest->kinds.count(kind) != 0)
                {
                    throw CorruptExportRecordError("export partition missing: " + path.string(), path.string(), 0);
                }
                Logger::instance().logf(LogLevel::Debug, "export", kBeginningOfTime,
                                        "no partition for kind %s in %s", kind_name(kind), m_dir.string().c_str());
                return std::make_unique<EmptyCursor>();
            }
            return std::make_unique<FileCursor>(path.string(), kind);
        }

        std::optional<ExportManifest> manifest() const override { return m_manifest; }

        const std::filesystem::path &dir() const noexcept { return m_dir; }

    private:
        class EmptyCursor final : public IExportCursor
        {
        public:
            std::optional<ExportRecord> next() override { return std::nullopt; }
            void rewind() override {}
        };

        class FileCursor final : public IExportCursor
        {
        public:
            FileCursor(std::string path, EntityKind kind) : m_path(std::move(path)), m_kind(kind)
            {
                try
                {
                    m_reader = std::make_unique<RecordFileReader>(m_path, RecordFileKind::ExportPartition);
                }
                catch (const RecordFileError &e)
                {
                    throw CorruptExportRecordError(std::string("export partition header unreadable: ") + e.what(), m_path, 0);
                }
            }

            std::optional<ExportRecord> next() override
            {
                const std::uint64_t index = m_reader->next_index();
                std::optional<ByteBuffer> body;
                try
                {
                    body = m_reader->next();
                }
                catch (const RecordFileError &e)
                {
                    throw CorruptExportRecordError(std::string("corrupt export record: ") + e.what(), m_path, e.record_index());
                }
                if (!body)
                {
                    return std::nullopt;
                }

                ExportRecord rec;
                try
                {
                    rec = decode_export_record(std::span<const std::byte>(body->data(), body->size()));
                }
                catch (const std::runtime_error &e)
                {
                    throw CorruptExportRecordError("corrupt export record in " + m_path + " at record " + std::to_string(index) + ": " + e.what(),
                                                   m_path, index);
                }
                if (rec.kind != m_kind)
                {
                    throw CorruptExportRecordError("export record of kind " + std::string(kind_name(rec.kind)) + " found in " + m_path,
                                                   m_path, index);
                }
                return rec;
            }

            void rewind() override { m_reader->rewind(); }

        private:
            std::string m_path;
            EntityKind m_kind;
            std::unique_ptr<RecordFileReader> m_reader;
        };

        static ExportManifest load_manifest_(const std::filesystem::path &path)
        {
            RecordFileReader in(path.string(), RecordFileKind::ExportManifest);
            ExportManifest m;
            try
            {
                WireReader r(in.header());
                m.exportStart = r.read_i64();
                m.exportCompletion = r.read_i64();
                const auto n = r.read_u32();
                for (std::uint32_t i = 0; i < n; ++i)
                {
                    const auto code = r.read_u32();
                    const auto kind = kind_from_code(code);
                    if (!kind)
                    {
                        throw std::runtime_error("unknown kind code " + std::to_string(code));
                    }
                    m.kinds.insert(*kind);
                }
                r.expect_end();
            }
            catch (const std::runtime_error &e)
            {
                throw CorruptExportRecordError("export manifest unreadable: " + std::string(e.what()), path.string(), 0);
            }
            return m;
        }

        std::filesystem::path m_dir;
        std::optional<ExportManifest> m_manifest;
    };

    // Writes the directory layout read by DirectoryExportReader. Every kind named in
    // the manifest gets a partition file, even when empty.
    class ExportWriter
    {
    public:
        ExportWriter(std::filesystem::path dir, ExportManifest manifest)
            : m_dir(std::move(dir)), m_manifest(std::move(manifest))
        {
            std::filesystem::create_directories(m_dir);
        }

        void write(const ExportRecord &rec)
        {
            if (m_closed)
            {
                throw std::logic_error("ExportWriter: write after close");
            }
            if (m_manifest.kinds.count(rec.kind) == 0)
            {
                throw std::invalid_argument(std::string("ExportWriter: kind not in manifest: ") + kind_name(rec.kind));
            }
            const auto body = encode_export_record(rec);
            partition_(rec.kind).append(body);
        }

        void close()
        {
            if (m_closed)
            {
                return;
            }
            for (const EntityKind kind : m_manifest.kinds)
            {
                partition_(kind).close();
            }

            WireWriter h;
            h.write_i64(m_manifest.exportStart);
            h.write_i64(m_manifest.exportCompletion);
            h.write_u32(static_cast<std::uint32_t>(m_manifest.kinds.size()));
            for (const EntityKind kind : m_manifest.kinds)
            {
                h.write_u32(kind_code(kind));
            }
            const auto header = h.take();
            RecordFileWriter manifest((m_dir / kExportManifestFile).string(), RecordFileKind::ExportManifest, header);
            manifest.close();
            m_closed = true;
        }

        const std::filesystem::path &dir() const noexcept { return m_dir; }

    private:
        RecordFileWriter &partition_(EntityKind kind)
        {
            auto it = m_partitions.find(kind);
            if (it == m_partitions.end())
            {
                auto w = std::make_unique<RecordFileWriter>(export_partition_path(m_dir, kind).string(), RecordFileKind::ExportPartition,
                                                            std::span<const std::byte>{});
                it = m_partitions.emplace(kind, std::move(w)).first;
            }
            return *it->second;
        }

        std::filesystem::path m_dir;
        ExportManifest m_manifest;
        std::map<EntityKind, std::unique_ptr<RecordFileWriter>> m_partitions;
        bool m_closed = false;
    };
}
