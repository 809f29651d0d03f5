/*
Purpose: Rank-count invariance oracle for distributed reconstruction.

What this tests: Every rank builds the same export and commit log; mpi_reconstruct
folds a disjoint share per rank and gathers at rank 0. The gathered snapshot and the
allreduced digest equal a single-process reconstruction, a window gap seen by all
ranks fails the call on all ranks, and an export directory that only one rank cannot
open fails input loading on every rank instead of leaving the others blocked.
*/

#include "mpi_replay.hpp"

#include <mpi.h>

#include <cstdio>
#include <filesystem>
#include <iterator>
#include <string>

namespace
{
    using regsnap::EntityKind;

    const regsnap::KindSet kKinds = {EntityKind::DomainBase, EntityKind::HostResource, EntityKind::ContactResource};

    void build(regsnap::InMemoryExport &exp, regsnap::CommitLogStore &log)
    {
        exp.set_manifest(regsnap::ExportManifest{.exportStart = 100, .exportCompletion = 200, .kinds = kKinds});
        for (int i = 0; i < 300; ++i)
        {
            const EntityKind kind = *std::next(kKinds.begin(), i % 3);
            exp.add(regsnap::ExportRecord{kind, "k" + std::to_string(i), regsnap::bytes_from_string("export"), 100 + i % 50});
        }
        for (regsnap::CommitTime t = 1; t <= 400; ++t)
        {
            regsnap::CommitLogTransaction txn;
            txn.entityGroupId = "group-" + std::to_string(t % 13);
            txn.commitTimestamp = t;
            const EntityKind kind = *std::next(kKinds.begin(), t % 3);
            const auto id = "k" + std::to_string((t * 11) % 350);
            if (t % 6 == 0)
            {
                txn.mutations.push_back(regsnap::Mutation::remove(kind, id));
            }
            else
            {
                txn.mutations.push_back(regsnap::Mutation::upsert(kind, id, regsnap::bytes_from_string("log@" + std::to_string(t))));
            }
            log.append(std::move(txn));
        }
        log.seal(400);
    }
}

int main(int argc, char **argv)
{
    MPI_Init(&argc, &argv);

    int rank = 0;
    int size = 1;
    MPI_Comm_rank(MPI_COMM_WORLD, &rank);
    MPI_Comm_size(MPI_COMM_WORLD, &size);

    if (size < 2)
    {
        MPI_Finalize();
        return 0;
    }

    regsnap::InMemoryExport exp;
    regsnap::CommitLogStore log(regsnap::CommitLogStoreConfig{.bucketCount = 6, .origin = 0});
    build(exp, log);
    const regsnap::TimeWindow window{0, 400};

    regsnap::ReplayEngine single;
    const auto expected = single.reconstruct(exp, log, window, kKinds);

    regsnap::ReplayConfig cfg;
    cfg.workerCount = 2;
    const auto result = regsnap::mpi_reconstruct(MPI_COMM_WORLD, exp, log, window, kKinds, cfg);

    int okLocal = (result.digest == expected.digest()) ? 1 : 0;
    if (rank == 0 && result.snapshot.encode() != expected.encode())
    {
        okLocal = 0;
    }
    if (rank != 0 && !result.snapshot.empty())
    {
        okLocal = 0;
    }

    // Unsealed window end: every rank must see the failure.
    bool failed = false;
    try
    {
        (void)regsnap::mpi_reconstruct(MPI_COMM_WORLD, exp, log, regsnap::TimeWindow{0, 500}, kKinds, cfg);
    }
    catch (const regsnap::WindowGapError &)
    {
        failed = true;
    }
    if (!failed)
    {
        okLocal = 0;
    }

    // Only rank 1 is handed a missing export directory.
    {
        namespace fs = std::filesystem;
        const fs::path present = fs::temp_directory_path() / ("regsnap_mpi_inputs_rank" + std::to_string(rank));
        fs::create_directories(present);
        const fs::path dir = (rank == 1) ? present / "missing" : present;

        bool loadFailed = false;
        try
        {
            regsnap::mpi_run_agreed(MPI_COMM_WORLD, "load inputs", [&]
                                    { regsnap::DirectoryExportReader reader(dir); });
        }
        catch (const std::runtime_error &)
        {
            loadFailed = true;
        }
        if (!loadFailed)
        {
            okLocal = 0;
        }
        fs::remove_all(present);
    }

    if (okLocal != 1)
    {
        std::fprintf(stderr, "distributed replay mismatch on rank %d (size=%d): count=%llu want %llu\n",
                     rank, size,
                     static_cast<unsigned long long>(result.digest.count),
                     static_cast<unsigned long long>(expected.digest().count));
    }

    int okGlobal = 0;
    MPI_Allreduce(&okLocal, &okGlobal, 1, MPI_INT, MPI_LAND, MPI_COMM_WORLD);

    MPI_Finalize();
    return (okGlobal == 1) ? 0 : 2;
}
