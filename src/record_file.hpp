#pragma once

#include "digest.hpp"
#include "errors.hpp"
#include "wire.hpp"

#include <cstdio>
#include <memory>
#include <string>

namespace regsnap
{
    // Framed record files:
    //   magic u32 | version u32 | kind u8 | header (len-prefixed)
    //   { len u32 | body | fnv1a64(body) u64 }*
    enum class RecordFileKind : std::uint8_t
    {
        CommitLogSegment = 1,
        ExportPartition = 2,
        ExportManifest = 3,
    };

    inline constexpr std::uint32_t kRecordFileMagic = 0x50534752u; // "RGSP"
    inline constexpr std::uint32_t kRecordFileVersion = 1;
    inline constexpr std::uint32_t kMaxRecordBytes = 64u * 1024u * 1024u;

    namespace detail
    {
        struct FileCloser
        {
            void operator()(std::FILE *f) const noexcept
            {
                if (f)
                {
                    std::fclose(f);
                }
            }
        };

        using FilePtr = std::unique_ptr<std::FILE, FileCloser>;

        inline void write_all(std::FILE *f, std::span<const std::byte> bytes, const std::string &path)
        {
            if (bytes.empty())
            {
                return;
            }
            if (std::fwrite(bytes.data(), 1, bytes.size(), f) != bytes.size())
            {
                throw std::runtime_error("write failed: " + path);
            }
        }
    }

    // Writes to "<path>.tmp" and renames into place on close(), so readers never see
    // a half-written file. Destroying an unclosed writer discards the temp file.
    class RecordFileWriter
    {
    public:
        RecordFileWriter(std::string path, RecordFileKind kind, std::span<const std::byte> header)
            : m_path(std::move(path)), m_tmpPath(m_path + ".tmp")
        {
            m_file.reset(std::fopen(m_tmpPath.c_str(), "wb"));
            if (!m_file)
            {
                throw std::runtime_error("RecordFileWriter: cannot open " + m_tmpPath);
            }

            WireWriter w;
            w.write_u32(kRecordFileMagic);
            w.write_u32(kRecordFileVersion);
            w.write_u8(static_cast<std::uint8_t>(kind));
            w.write_bytes(header);
            const auto bytes = w.take();
            detail::write_all(m_file.get(), bytes, m_tmpPath);
        }

        RecordFileWriter(const RecordFileWriter &) = delete;
        RecordFileWriter &operator=(const RecordFileWriter &) = delete;

        ~RecordFileWriter()
        {
            if (m_file)
            {
                m_file.reset();
                std::remove(m_tmpPath.c_str());
            }
        }

        void append(std::span<const std::byte> body)
        {
            if (!m_file)
            {
                throw std::logic_error("RecordFileWriter: append after close");
            }
            if (body.size() > kMaxRecordBytes)
            {
                throw std::invalid_argument("RecordFileWriter: record too large");
            }
            WireWriter w;
            w.write_bytes(body);
            w.write_u64(detail::fnv1a64(body));
            const auto bytes = w.take();
            detail::write_all(m_file.get(), bytes, m_tmpPath);
            ++m_records;
        }

        void close()
        {
            if (!m_file)
            {
                return;
            }
            const bool flushed = std::fflush(m_file.get()) == 0;
            const bool closed = std::fclose(m_file.release()) == 0;
            if (!flushed || !closed)
            {
                std::remove(m_tmpPath.c_str());
                throw std::runtime_error("RecordFileWriter: flush failed for " + m_tmpPath);
            }
            if (std::rename(m_tmpPath.c_str(), m_path.c_str()) != 0)
            {
                std::remove(m_tmpPath.c_str());
                throw std::runtime_error("RecordFileWriter: cannot rename into " + m_path);
            }
        }

        std::uint64_t records() const noexcept { return m_records; }
        const std::string &path() const noexcept { return m_path; }

    private:
        std::string m_path;
        std::string m_tmpPath;
        detail::FilePtr m_file;
        std::uint64_t m_records = 0;
    };

    // Sequential reader. next() returns nullopt at a clean end of file and throws
    // RecordFileError on truncation or checksum mismatch. rewind() restarts at the
    // first record.
    class RecordFileReader
    {
    public:
        RecordFileReader(std::string path, RecordFileKind expected) : m_path(std::move(path))
        {
            m_file.reset(std::fopen(m_path.c_str(), "rb"));
            if (!m_file)
            {
                throw std::runtime_error("RecordFileReader: cannot open " + m_path);
            }

            const auto fixed = read_exact_(9, 0);
            if (!fixed)
            {
                fail_("missing file header", 0);
            }
            WireReader r(std::span<const std::byte>(fixed->data(), fixed->size()));
            if (r.read_u32() != kRecordFileMagic)
            {
                fail_("bad magic", 0);
            }
            if (r.read_u32() != kRecordFileVersion)
            {
                fail_("unsupported version", 0);
            }
            if (r.read_u8() != static_cast<std::uint8_t>(expected))
            {
                fail_("unexpected file kind", 0);
            }
            m_header = read_sized_(0);
            m_dataStart = std::ftell(m_file.get());
            if (m_dataStart < 0)
            {
                throw std::runtime_error("RecordFileReader: ftell failed for " + m_path);
            }
        }

        std::span<const std::byte> header() const noexcept { return std::span<const std::byte>(m_header.data(), m_header.size()); }

        std::optional<ByteBuffer> next()
        {
            const std::uint64_t index = m_index;
            if (at_eof_())
            {
                return std::nullopt;
            }
            ByteBuffer body = read_sized_(index);
            const auto sum = read_exact_(8, index);
            if (!sum)
            {
                fail_("truncated checksum", index);
            }
            WireReader r(std::span<const std::byte>(sum->data(), sum->size()));
            if (r.read_u64() != detail::fnv1a64(std::span<const std::byte>(body.data(), body.size())))
            {
                fail_("checksum mismatch", index);
            }
            ++m_index;
            return body;
        }

        void rewind()
        {
            if (std::fseek(m_file.get(), m_dataStart, SEEK_SET) != 0)
            {
                throw std::runtime_error("RecordFileReader: seek failed for " + m_path);
            }
            m_index = 0;
        }

        std::uint64_t next_index() const noexcept { return m_index; }
        const std::string &path() const noexcept { return m_path; }

    private:
        [[noreturn]] void fail_(const char *why, std::uint64_t index) const
        {
            throw RecordFileError("RecordFileReader: " + std::string(why) + " in " + m_path + " at record " + std::to_string(index),
                                  m_path, index);
        }

        bool at_eof_()
        {
            const int c = std::fgetc(m_file.get());
            if (c == EOF)
            {
                return true;
            }
            std::ungetc(c, m_file.get());
            return false;
        }

        // nullopt if zero bytes were available; throws on a partial read.
        std::optional<ByteBuffer> read_exact_(std::size_t n, std::uint64_t index)
        {
            ByteBuffer out(n);
            const std::size_t got = (n == 0) ? 0 : std::fread(out.data(), 1, n, m_file.get());
            if (got == 0 && n != 0)
            {
                return std::nullopt;
            }
            if (got != n)
            {
                fail_("truncated record", index);
            }
            return out;
        }

        ByteBuffer read_sized_(std::uint64_t index)
        {
            const auto lenBytes = read_exact_(4, index);
            if (!lenBytes)
            {
                fail_("truncated length", index);
            }
            WireReader r(std::span<const std::byte>(lenBytes->data(), lenBytes->size()));
            const std::uint32_t len = r.read_u32();
            if (len > kMaxRecordBytes)
            {
                fail_("record length out of range", index);
            }
            if (len == 0)
            {
                return {};
            }
            auto body = read_exact_(len, index);
            if (!body)
            {
                fail_("truncated body", index);
            }
            return std::move(*body);
        }

        std::string m_path;
        detail::FilePtr m_file;
        ByteBuffer m_header;
        long m_dataStart = 0;
        std::uint64_t m_index = 0;
    };
}
