#pragma once

#include "mpi_collectives.hpp"
#include "replay_engine.hpp"

#include <mpi.h>

#include <exception>
#include <string>

namespace regsnap
{
    struct MpiReplayResult
    {
        // The merged snapshot on the root rank; empty on the others.
        Snapshot snapshot;

        // Digest of the whole snapshot, identical on every rank.
        SnapshotDigest digest;

        ReplayStats localStats;
    };

    // Runs fn on every rank of comm and agrees on the outcome. If fn throws on any
    // rank, every rank throws: the original exception where it was raised, a
    // SnapshotError naming `what` on the others.
    template <typename Fn>
    void mpi_run_agreed(MPI_Comm comm, const char *what, Fn &&fn)
    {
        std::exception_ptr failure;
        try
        {
            fn();
        }
        catch (const std::exception &)
        {
            failure = std::current_exception();
        }

        if (mpi_allreduce_any(comm, failure != nullptr))
        {
            if (failure)
            {
                std::rethrow_exception(failure);
            }
            int rank = 0;
            MPI_Comm_rank(comm, &rank);
            throw SnapshotError(std::string(what) + ": failed on another rank (this is rank " + std::to_string(rank) + ")");
        }
    }

    // Distributed reconstruction: every rank reads the same export and log, folds only
    // the keys it owns (entity_key_hash % size == rank), and the disjoint partial
    // snapshots are merged at `root`. A fatal error on any rank fails the call on all
    // ranks, so no rank can return a partial result.
    inline MpiReplayResult mpi_reconstruct(MPI_Comm comm,
                                           const IExportSource &exportSource,
                                           const ICommitLogSource &log,
                                           TimeWindow window,
                                           const KindSet &trackedKinds,
                                           ReplayConfig cfg = {},
                                           int root = 0)
    {
        int rank = 0;
        int size = 1;
        MPI_Comm_rank(comm, &rank);
        MPI_Comm_size(comm, &size);

        cfg.partitionCount = static_cast<std::uint32_t>(size);
        cfg.partitionIndex = static_cast<std::uint32_t>(rank);

        MpiReplayResult result;
        Snapshot local;
        mpi_run_agreed(comm, "mpi_reconstruct", [&]
                       {
                           ReplayEngine engine(cfg);
                           local = engine.reconstruct(exportSource, log, window, trackedKinds);
                           result.localStats = engine.stats(); });

        result.digest = mpi_allreduce_digest(comm, local.digest());

        const auto parts = mpi_gather_bytes(comm, local.encode(), root);
        result.snapshot = Snapshot(window, trackedKinds);
        for (const auto &bytes : parts)
        {
            result.snapshot.merge_disjoint(Snapshot::decode(std::span<const std::byte>(bytes.data(), bytes.size())));
        }

        Logger::instance().logf(LogLevel::Info, "mpi-replay", window.end,
                                "rank %d folded %llu entities of %llu",
                                rank,
                                static_cast<unsigned long long>(local.size()),
                                static_cast<unsigned long long>(result.digest.count));
        return result;
    }
}
