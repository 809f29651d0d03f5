#include "checkpoint.hpp"
#include "entity_store.hpp"
#include "replay_engine.hpp"

#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <string>

// Walks a registry store through a storage migration:
// writes land while an export is running, the export misses some of them, and the
// commit log closes the difference. Then the consumed log is checkpointed and purged.

namespace
{
    constexpr regsnap::CommitTime kStart = 946684800000; // 2000-01-01T00:00:00Z

    regsnap::ByteBuffer text(const std::string &s) { return regsnap::bytes_from_string(s); }

    void print_table(const regsnap::Snapshot &snap, regsnap::EntityKind kind)
    {
        for (const auto &[id, e] : snap.table(kind))
        {
            std::cout << "  " << regsnap::kind_name(kind) << "/" << id
                      << " @" << e.effectiveTimestamp
                      << " = " << regsnap::string_from_bytes(*e.payload) << "\n";
        }
    }
}

int main(int argc, char **argv)
{
    namespace fs = std::filesystem;
    const fs::path root = (argc > 1) ? fs::path(argv[1]) : fs::temp_directory_path() / "regsnap_migration_demo";
    fs::remove_all(root);
    const fs::path logDir = root / "commit_logs";
    const fs::path exportDir = root / "export";
    const fs::path outDir = root / "snapshot";

    regsnap::Logger::instance().set_level(regsnap::LogLevel::Info);

    regsnap::FakeClock clock(kStart);
    regsnap::TimestampAuthority authority;
    regsnap::CommitLogStore log(regsnap::CommitLogStoreConfig{.bucketCount = 8, .origin = kStart});
    regsnap::LiveEntityStore store(clock, authority, log);

    const regsnap::KindSet kinds = {regsnap::EntityKind::Registry,
                                    regsnap::EntityKind::ContactResource,
                                    regsnap::EntityKind::DomainBase};

    store.upsert("registry/tld1", regsnap::EntityKind::Registry, "tld1", text("tld1 create=8.00"));
    store.upsert("contact/filler", regsnap::EntityKind::ContactResource, "contact_filler", text("filler"));
    clock.advance_one_milli();
    store.seal_now(logDir);

    clock.advance_one_milli();
    store.upsert("registry/tld1", regsnap::EntityKind::Registry, "tld1", text("tld1 create=9.00"));
    clock.advance_one_milli();
    store.upsert("contact/contact", regsnap::EntityKind::ContactResource, "contact", text("contact"));
    store.upsert("domain/domain1.tld1", regsnap::EntityKind::DomainBase, "domain1.tld1", text("domain1 auth=old"));

    // The export runs concurrently with writes and misses the new contact.
    store.export_to(exportDir, kinds, {regsnap::EntityKey{regsnap::EntityKind::ContactResource, "contact"}});

    clock.advance_one_milli();
    store.remove("contact/filler", regsnap::EntityKind::ContactResource, "contact_filler");
    clock.advance_one_milli();
    store.seal_now(logDir);

    clock.advance_one_milli();
    store.upsert("domain/domain1.tld1", regsnap::EntityKind::DomainBase, "domain1.tld1", text("domain1 auth=NewPass"));
    clock.advance_one_milli();
    const auto last = store.seal_now(logDir);

    int rc = 0;
    try
    {
        regsnap::ReplayConfig cfg;
        cfg.workerCount = 4;
        cfg.logLevel = regsnap::LogLevel::Info;
        const auto snap = regsnap::reconstruct_from_files(exportDir, logDir, kStart, last.upper, kinds, cfg);

        std::cout << "snapshot as of " << snap.as_of() << ":\n";
        for (const auto k : kinds)
        {
            print_table(snap, k);
        }

        const bool exact = snap.digest() == store.view(kinds).digest();
        std::cout << "matches live store: " << (exact ? "yes" : "NO") << "\n";
        rc = exact ? 0 : 1;

        regsnap::write_snapshot(outDir, snap);

        // The migration loader has consumed everything up to the cutoff.
        regsnap::CheckpointAuthority checkpoints;
        checkpoints.register_consumer("sql-migration", kStart);
        checkpoints.confirm("sql-migration", last.upper);
        checkpoints.advance(log, last.upper);
        std::cout << "purged " << log.purge_before(last.upper) << " transactions\n";
    }
    catch (const regsnap::SnapshotError &e)
    {
        std::cerr << "reconstruction failed: " << e.what() << "\n";
        rc = 2;
    }

    return rc;
}
