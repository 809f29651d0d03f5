#include "replay_engine.hpp"

#if defined(REGSNAP_HAS_MPI)
#include "mpi_replay.hpp"
#include <mpi.h>
#endif

#include <charconv>
#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <string>
#include <string_view>

namespace
{
    struct Params
    {
        std::string exportDir;
        std::string logDir;
        std::string outDir;
        regsnap::CommitTime start = 0;
        regsnap::CommitTime end = 0;
        bool hasStart = false;
        bool hasEnd = false;
        regsnap::KindSet kinds;
        std::size_t workers = 1;
        regsnap::LogLevel logLevel = regsnap::LogLevel::Warn;
        bool printDigest = false;
    };

    bool parse_i64(std::string_view s, std::int64_t &out)
    {
        auto r = std::from_chars(s.data(), s.data() + s.size(), out);
        return r.ec == std::errc() && r.ptr == s.data() + s.size();
    }

    bool parse_size(std::string_view s, std::size_t &out)
    {
        unsigned long long v = 0;
        auto r = std::from_chars(s.data(), s.data() + s.size(), v);
        if (r.ec != std::errc() || r.ptr != s.data() + s.size())
        {
            return false;
        }
        out = static_cast<std::size_t>(v);
        return true;
    }

    [[noreturn]] void usage_and_exit(int rank)
    {
        if (rank == 0)
        {
            std::cerr << "reconstruct_snapshot (point-in-time view from export + commit log)\n"
                      << "  --export DIR      export directory (<Kind>.export partitions)\n"
                      << "  --logs DIR        commit log directory (commit_diff_until_*.log)\n"
                      << "  --start MS        window start, exclusive\n"
                      << "  --end MS          window end / cutoff, inclusive\n"
                      << "  --kinds K1,K2     tracked kinds\n"
                      << "  --out DIR         write the snapshot in export layout\n"
                      << "  --workers N\n"
                      << "  --log-level L     error|warn|info|debug|trace|off\n"
                      << "  --digest          print the snapshot digest\n";
        }

#if defined(REGSNAP_HAS_MPI)
        MPI_Abort(MPI_COMM_WORLD, 2);
#endif
        std::exit(2);
    }

    Params parse_args(int argc, char **argv, int rank)
    {
        Params p;
        for (int i = 1; i < argc; ++i)
        {
            std::string_view a(argv[i]);
            auto need = [&]() -> std::string_view
            {
                if (i + 1 >= argc)
                {
                    usage_and_exit(rank);
                }
                return std::string_view(argv[++i]);
            };

            if (a == "--export")
            {
                p.exportDir = std::string(need());
            }
            else if (a == "--logs")
            {
                p.logDir = std::string(need());
            }
            else if (a == "--out")
            {
                p.outDir = std::string(need());
            }
            else if (a == "--start")
            {
                if (!parse_i64(need(), p.start))
                    usage_and_exit(rank);
                p.hasStart = true;
            }
            else if (a == "--end")
            {
                if (!parse_i64(need(), p.end))
                    usage_and_exit(rank);
                p.hasEnd = true;
            }
            else if (a == "--kinds")
            {
                try
                {
                    p.kinds = regsnap::parse_kind_list(need());
                }
                catch (const regsnap::UnknownKindError &e)
                {
                    if (rank == 0)
                    {
                        std::cerr << e.what() << "\n";
                    }
                    usage_and_exit(rank);
                }
            }
            else if (a == "--workers")
            {
                if (!parse_size(need(), p.workers))
                    usage_and_exit(rank);
            }
            else if (a == "--log-level")
            {
                auto lvl = regsnap::parse_log_level(need());
                if (!lvl)
                    usage_and_exit(rank);
                p.logLevel = *lvl;
            }
            else if (a == "--digest")
            {
                p.printDigest = true;
            }
            else
            {
                usage_and_exit(rank);
            }
        }

        if (p.exportDir.empty() || p.logDir.empty() || !p.hasStart || !p.hasEnd || p.kinds.empty() || p.workers == 0 || p.start > p.end)
        {
            usage_and_exit(rank);
        }
        return p;
    }

    void report(const regsnap::Snapshot &snap, const regsnap::SnapshotDigest &digest, const Params &p)
    {
        for (const regsnap::EntityKind k : p.kinds)
        {
            std::cout << regsnap::kind_name(k) << ": " << snap.table(k).size() << "\n";
        }
        if (p.printDigest)
        {
            std::cout << "digest: count=" << digest.count
                      << " sum=" << digest.entitySum
                      << " xor=" << digest.entityXor << "\n";
        }
        if (!p.outDir.empty())
        {
            regsnap::write_snapshot(p.outDir, snap);
        }
    }
}

int main(int argc, char **argv)
{
    int rank = 0;
    int size = 1;

#if defined(REGSNAP_HAS_MPI)
    MPI_Init(&argc, &argv);
    MPI_Comm_rank(MPI_COMM_WORLD, &rank);
    MPI_Comm_size(MPI_COMM_WORLD, &size);
#endif

    const Params p = parse_args(argc, argv, rank);

    regsnap::ReplayConfig cfg;
    cfg.workerCount = p.workers;
    cfg.logLevel = p.logLevel;

    int rc = 0;
    try
    {
        const regsnap::TimeWindow window{p.start, p.end};

        if (size > 1)
        {
#if defined(REGSNAP_HAS_MPI)
            // A rank that cannot open its inputs fails every rank.
            std::unique_ptr<regsnap::DirectoryExportReader> exportSource;
            std::unique_ptr<regsnap::CommitLogStore> log;
            regsnap::mpi_run_agreed(MPI_COMM_WORLD, "load inputs", [&]
                                    {
                                        exportSource = std::make_unique<regsnap::DirectoryExportReader>(p.exportDir);
                                        log = regsnap::load_commit_log_dir(p.logDir); });

            auto result = regsnap::mpi_reconstruct(MPI_COMM_WORLD, *exportSource, *log, window, p.kinds, cfg);
            if (rank == 0)
            {
                report(result.snapshot, result.digest, p);
            }
#endif
        }
        else
        {
            regsnap::DirectoryExportReader exportSource(p.exportDir);
            const auto log = regsnap::load_commit_log_dir(p.logDir);
            regsnap::ReplayEngine engine(cfg);
            const auto snap = engine.reconstruct(exportSource, *log, window, p.kinds);
            report(snap, snap.digest(), p);
            const auto &st = engine.stats();
            std::cerr << "transactions=" << st.transactionsScanned
                      << " applied=" << st.mutationsApplied
                      << " superseded=" << st.mutationsSuperseded
                      << " unknownKind=" << st.unknownKindMutations
                      << " untrackedKind=" << st.untrackedKindMutations << "\n";
        }
    }
    catch (const regsnap::WindowGapError &e)
    {
        std::cerr << "window gap: " << e.what() << "\n";
        rc = 3;
    }
    catch (const regsnap::SnapshotError &e)
    {
        std::cerr << "reconstruction failed: " << e.what() << "\n";
        rc = 4;
    }
    catch (const std::exception &e)
    {
        std::cerr << "error: " << e.what() << "\n";
        rc = 1;
    }

#if defined(REGSNAP_HAS_MPI)
    MPI_Finalize();
#endif
    return rc;
}
