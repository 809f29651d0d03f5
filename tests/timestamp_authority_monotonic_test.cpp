/*
Purpose: Tests per-group commit timestamp monotonicity.

What this tests: Consecutive next_timestamp calls for one entity group always return
strictly increasing values, even when the proposed wall-clock value stalls or steps
back within tolerance, and groups do not influence each other.
*/

#include "timestamp_authority.hpp"

#include <cassert>
#include <vector>

int main()
{
    regsnap::TimestampAuthority ta(regsnap::TimestampAuthorityConfig{.regressionTolerance = 100});

    // First commit to a group is accepted as proposed.
    assert(ta.next_timestamp("domain/example.tld", 1000) == 1000);

    // Stalled clock: same proposed value is advanced by one tick each time.
    assert(ta.next_timestamp("domain/example.tld", 1000) == 1001);
    assert(ta.next_timestamp("domain/example.tld", 1000) == 1002);

    // Small regression is corrected, not rejected.
    assert(ta.next_timestamp("domain/example.tld", 950) == 1003);

    // Clock moving forward again is taken as-is.
    assert(ta.next_timestamp("domain/example.tld", 2000) == 2000);

    // Another group has its own sequence.
    assert(ta.next_timestamp("contact/jd1234", 500) == 500);
    assert(ta.next_timestamp("contact/jd1234", 500) == 501);
    assert(ta.last_accepted("domain/example.tld").value() == 2000);
    assert(ta.last_accepted("contact/jd1234").value() == 501);
    assert(!ta.last_accepted("host/ns1.example.tld").has_value());

    // Any non-increasing proposal sequence yields a strictly increasing accepted one.
    std::vector<regsnap::CommitTime> accepted;
    regsnap::CommitTime proposed = 5000;
    for (int i = 0; i < 50; ++i)
    {
        accepted.push_back(ta.next_timestamp("registry/tld", proposed));
        if (i % 3 == 0)
        {
            proposed -= 1;
        }
    }
    for (std::size_t i = 1; i < accepted.size(); ++i)
    {
        assert(accepted[i] > accepted[i - 1]);
    }

    // observe() only ever raises the last accepted value.
    ta.observe("host/ns1.example.tld", 700);
    ta.observe("host/ns1.example.tld", 600);
    assert(ta.last_accepted("host/ns1.example.tld").value() == 700);
    assert(ta.next_timestamp("host/ns1.example.tld", 650) == 701);

    assert(ta.corrections() > 0);
    return 0;
}
