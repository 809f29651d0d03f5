#pragma once

#include "digest.hpp"

#include <mpi.h>

#include <cstdint>
#include <limits>
#include <stdexcept>
#include <vector>

namespace regsnap
{
    // Allreduce logical-OR, e.g. "did any rank fail".
    inline bool mpi_allreduce_any(MPI_Comm comm, bool local)
    {
        int in = local ? 1 : 0;
        int out = 0;
        const int rc = MPI_Allreduce(&in, &out, 1, MPI_INT, MPI_LOR, comm);
        if (rc != MPI_SUCCESS)
        {
            MPI_Abort(comm, 4);
        }
        return out != 0;
    }

    inline std::uint64_t mpi_allreduce_sum_u64(MPI_Comm comm, std::uint64_t local)
    {
        std::uint64_t out = 0;
        const int rc = MPI_Allreduce(&local, &out, 1, MPI_UINT64_T, MPI_SUM, comm);
        if (rc != MPI_SUCCESS)
        {
            MPI_Abort(comm, 5);
        }
        return out;
    }

    inline std::uint64_t mpi_allreduce_xor_u64(MPI_Comm comm, std::uint64_t local)
    {
        std::uint64_t out = 0;
        const int rc = MPI_Allreduce(&local, &out, 1, MPI_UINT64_T, MPI_BXOR, comm);
        if (rc != MPI_SUCCESS)
        {
            MPI_Abort(comm, 6);
        }
        return out;
    }

    // Combines per-rank digests of disjoint partitions into the digest of the whole.
    inline SnapshotDigest mpi_allreduce_digest(MPI_Comm comm, const SnapshotDigest &local)
    {
        SnapshotDigest out;
        out.entitySum = mpi_allreduce_sum_u64(comm, local.entitySum);
        out.entityXor = mpi_allreduce_xor_u64(comm, local.entityXor);
        out.count = mpi_allreduce_sum_u64(comm, local.count);
        return out;
    }

    // Gathers one variable-length buffer per rank at `root`. Non-root ranks get an
    // empty vector.
    inline std::vector<ByteBuffer> mpi_gather_bytes(MPI_Comm comm, const ByteBuffer &local, int root = 0)
    {
        int rank = 0;
        int size = 1;
        MPI_Comm_rank(comm, &rank);
        MPI_Comm_size(comm, &size);

        if (local.size() > static_cast<std::size_t>(std::numeric_limits<int>::max()))
        {
            throw std::runtime_error("mpi_gather_bytes: buffer exceeds MPI count range");
        }
        const int localSize = static_cast<int>(local.size());

        std::vector<int> sizes(rank == root ? static_cast<std::size_t>(size) : 0);
        int rc = MPI_Gather(&localSize, 1, MPI_INT, sizes.data(), 1, MPI_INT, root, comm);
        if (rc != MPI_SUCCESS)
        {
            MPI_Abort(comm, 7);
        }

        std::vector<int> displs;
        ByteBuffer all;
        if (rank == root)
        {
            displs.resize(static_cast<std::size_t>(size));
            long long total = 0;
            for (int i = 0; i < size; ++i)
            {
                displs[static_cast<std::size_t>(i)] = static_cast<int>(total);
                total += sizes[static_cast<std::size_t>(i)];
            }
            if (total > std::numeric_limits<int>::max())
            {
                MPI_Abort(comm, 8);
            }
            all.resize(static_cast<std::size_t>(total));
        }

        rc = MPI_Gatherv(local.data(), localSize, MPI_BYTE,
                         all.data(), sizes.data(), displs.data(), MPI_BYTE, root, comm);
        if (rc != MPI_SUCCESS)
        {
            MPI_Abort(comm, 9);
        }

        std::vector<ByteBuffer> out;
        if (rank == root)
        {
            out.reserve(static_cast<std::size_t>(size));
            for (int i = 0; i < size; ++i)
            {
                const auto begin = all.begin() + displs[static_cast<std::size_t>(i)];
                out.emplace_back(begin, begin + sizes[static_cast<std::size_t>(i)]);
            }
        }
        return out;
    }
}
