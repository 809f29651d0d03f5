/*
Purpose: End-to-end storage migration scenario over on-disk artifacts.

What this tests: A registry (R) and a contact (A) exist at t0; R is updated at t1; a
contact (B) and a domain (D) are created at t2 while the export runs, and the export
misses D; A is deleted at t3 and D updated at t4. Reconstructing from the export
directory plus the sealed commit log files yields R as of t1, B from the export, D as
of t4 and no A. An earlier cutoff sees D's original state and A still present.
*/

#include "entity_store.hpp"
#include "replay_engine.hpp"

#include <cassert>
#include <filesystem>

namespace
{
    using regsnap::EntityKind;

    constexpr regsnap::CommitTime kStart = 946684800000; // 2000-01-01T00:00:00Z

    std::string payload_of(const regsnap::Snapshot &s, EntityKind kind, const std::string &id)
    {
        const auto *e = s.find(kind, id);
        assert(e && !e->absent());
        return regsnap::string_from_bytes(*e->payload);
    }
}

int main()
{
    namespace fs = std::filesystem;
    const fs::path root = fs::temp_directory_path() / "regsnap_load_snapshot_scenario_test";
    fs::remove_all(root);
    const fs::path logDir = root / "commit_logs";
    const fs::path exportDir = root / "export";

    regsnap::FakeClock clock(kStart);
    regsnap::TimestampAuthority authority;
    regsnap::CommitLogStore log(regsnap::CommitLogStoreConfig{.bucketCount = 8, .origin = kStart});
    regsnap::LiveEntityStore store(clock, authority, log);

    const regsnap::KindSet kinds = {EntityKind::Registry, EntityKind::ContactResource, EntityKind::DomainBase};

    // t0: the log is sealed through kStart, so the first commits land one tick later.
    const auto t0 = store.upsert("registry/tld", EntityKind::Registry, "tld", regsnap::bytes_from_string("tld create=8.00"));
    store.upsert("contact/a", EntityKind::ContactResource, "contact-a", regsnap::bytes_from_string("contact a"));
    assert(t0 == kStart + 1);
    clock.advance_one_milli();
    store.seal_now(logDir);

    clock.advance_one_milli();
    const auto t1 = store.upsert("registry/tld", EntityKind::Registry, "tld", regsnap::bytes_from_string("tld create=9.00"));

    clock.advance_one_milli();
    const auto t2 = store.upsert("contact/b", EntityKind::ContactResource, "contact-b", regsnap::bytes_from_string("contact b"));
    store.upsert("domain/d.tld", EntityKind::DomainBase, "d.tld", regsnap::bytes_from_string("d auth=old"));

    const auto manifest = store.export_to(exportDir, kinds, {regsnap::EntityKey{EntityKind::DomainBase, "d.tld"}});
    assert(manifest.exportCompletion >= t2);

    clock.advance_one_milli();
    const auto t3 = store.remove("contact/a", EntityKind::ContactResource, "contact-a");
    clock.advance_one_milli();
    const auto mid = store.seal_now(logDir);

    clock.advance_one_milli();
    const auto t4 = store.upsert("domain/d.tld", EntityKind::DomainBase, "d.tld", regsnap::bytes_from_string("d auth=NewPass"));
    clock.advance_one_milli();
    const auto last = store.seal_now(logDir);

    assert(t0 < t1 && t1 < t2 && t2 < t3 && t3 < mid.upper && mid.upper < t4 && t4 <= last.upper);

    regsnap::ReplayConfig cfg;
    cfg.workerCount = 3;
    regsnap::ReplayStats stats;
    const auto snap = regsnap::reconstruct_from_files(exportDir, logDir, kStart, last.upper, kinds, cfg, &stats);

    assert(snap.size() == 3);
    assert(payload_of(snap, EntityKind::Registry, "tld") == "tld create=9.00");
    assert(snap.find(EntityKind::Registry, "tld")->effectiveTimestamp == t1);
    assert(payload_of(snap, EntityKind::ContactResource, "contact-b") == "contact b");
    assert(snap.find(EntityKind::ContactResource, "contact-b")->effectiveTimestamp == t2);
    assert(payload_of(snap, EntityKind::DomainBase, "d.tld") == "d auth=NewPass");
    assert(snap.find(EntityKind::DomainBase, "d.tld")->effectiveTimestamp == t4);
    assert(snap.find(EntityKind::ContactResource, "contact-a") == nullptr);

    assert(stats.exportRecordsSeeded == 3);
    assert(stats.deletesApplied == 1);
    assert(stats.tombstonesDropped == 1);

    // Identical to the live store at the same instant.
    assert(snap.digest() == store.view(kinds).digest());

    // Point-in-time view at the middle seal.
    const auto earlier = regsnap::reconstruct_from_files(exportDir, logDir, kStart, mid.upper, kinds);
    assert(payload_of(earlier, EntityKind::DomainBase, "d.tld") == "d auth=old");
    assert(earlier.find(EntityKind::ContactResource, "contact-a") == nullptr);

    const auto beforeDelete = regsnap::reconstruct_from_files(exportDir, logDir, kStart, t2, kinds);
    assert(payload_of(beforeDelete, EntityKind::ContactResource, "contact-a") == "contact a");

    fs::remove_all(root);
    return 0;
}
