/*
Purpose: Tests cooperative cancellation of a reconstruction.

What this tests: A raised cancel flag makes reconstruct() throw ReplayCancelledError
instead of returning a partial snapshot, from both the single-threaded and the
multi-worker fold, and the same engine reconstructs normally once the flag is cleared.
*/

#include "replay_engine.hpp"

#include <atomic>
#include <cassert>

int main()
{
    using regsnap::EntityKind;

    regsnap::InMemoryExport exp;
    for (int i = 0; i < 100; ++i)
    {
        exp.add(regsnap::ExportRecord{EntityKind::AllocationToken, "token-" + std::to_string(i), regsnap::bytes_from_string("unused"), 1});
    }

    regsnap::CommitLogStore log(regsnap::CommitLogStoreConfig{.origin = 0});
    for (regsnap::CommitTime t = 1; t <= 5000; ++t)
    {
        regsnap::CommitLogTransaction txn;
        txn.entityGroupId = "token/" + std::to_string(t % 100);
        txn.commitTimestamp = t;
        txn.mutations.push_back(regsnap::Mutation::upsert(EntityKind::AllocationToken, "token-" + std::to_string(t % 100),
                                                          regsnap::bytes_from_string("redeemed@" + std::to_string(t))));
        log.append(std::move(txn));
    }
    log.seal(5000);

    const regsnap::KindSet kinds = {EntityKind::AllocationToken};
    std::atomic<bool> cancel{true};

    for (const std::size_t workers : {1u, 4u})
    {
        regsnap::ReplayConfig cfg;
        cfg.workerCount = workers;
        cfg.cancel = &cancel;
        regsnap::ReplayEngine engine(cfg);

        cancel.store(true);
        bool cancelled = false;
        try
        {
            (void)engine.reconstruct(exp, log, regsnap::TimeWindow{0, 5000}, kinds);
        }
        catch (const regsnap::ReplayCancelledError &)
        {
            cancelled = true;
        }
        assert(cancelled);

        cancel.store(false);
        const auto snap = engine.reconstruct(exp, log, regsnap::TimeWindow{0, 5000}, kinds);
        assert(snap.size() == 100);
        assert(snap.find(EntityKind::AllocationToken, "token-0")->effectiveTimestamp == 5000);
    }
    return 0;
}
