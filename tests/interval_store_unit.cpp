// Interval store: creation, correction rules on update, removal and sorted reads.
#include <cmath>
#include <iostream>
#include <string>

#include "interval_store.hpp"
#include "logging.hpp"

using namespace subforge;

namespace {

bool check(bool cond, const std::string &msg) {
    if (!cond) {
        std::cerr << "[interval_store_unit] FAIL: " << msg << "\n";
    }
    return cond;
}

bool near(double a, double b) { return std::abs(a - b) < 1e-9; }

bool valid(const SubtitleInterval &s) {
    return s.start >= 0.0 && s.end - s.start >= kMinIntervalDuration;
}

bool test_create() {
    IntervalStore store;
    auto a = store.create(1.0, 2.0, "a");
    bool ok = check(a == "subtitle-1", "first id is subtitle-1");
    auto b = store.create(-1.0, 0.5);
    auto sb = store.get(b);
    ok &= check(sb && near(sb->start, 0.0) && near(sb->end, 0.5), "negative start clamps to 0");
    auto c = store.create(4.0, 4.05);
    auto sc = store.get(c);
    ok &= check(sc && valid(*sc), "short range widened to minimum duration");

    bool threw = false;
    try {
        store.create(2.0, 1.0);
    } catch (const InvalidRangeError &) {
        threw = true;
    }
    ok &= check(threw, "end < start rejected");
    threw = false;
    try {
        store.create(3.0, 3.0);
    } catch (const InvalidRangeError &) {
        threw = true;
    }
    ok &= check(threw, "end == start rejected");
    ok &= check(store.size() == 3, "rejected creates leave store untouched");
    return ok;
}

bool test_update_rules() {
    IntervalStore store;
    auto id = store.create(1.0, 3.0);
    bool ok = check(store.update(id, IntervalPatch{5.0, std::nullopt, std::nullopt}),
                    "start update accepted");
    auto s = store.get(id);
    ok &= check(s && near(s->start, 5.0) && near(s->end, 7.0),
                "start past end carries previous duration");

    ok &= check(store.update(id, IntervalPatch{std::nullopt, 1.0, std::nullopt}),
                "end update accepted");
    s = store.get(id);
    ok &= check(s && near(s->start, 0.0) && near(s->end, 1.0),
                "end before start pulls start back, clamped at 0");

    store.update(id, IntervalPatch{4.0, 4.0, std::string("joint")});
    s = store.get(id);
    ok &= check(s && near(s->start, 4.0) && valid(*s) && s->text == "joint",
                "joint update keeps start and widens end");

    store.update(id, IntervalPatch{-3.0, std::nullopt, std::nullopt});
    s = store.get(id);
    ok &= check(s && near(s->start, 0.0) && valid(*s), "negative start clamps");

    ok &= check(!store.update("subtitle-99", IntervalPatch{1.0, 2.0, std::nullopt}),
                "unknown id reports false");
    ok &= check(!store.update(id, IntervalPatch{std::nan(""), std::nullopt, std::nullopt}),
                "non-finite start rejected");
    s = store.get(id);
    ok &= check(s && near(s->start, 0.0), "rejected update leaves interval unchanged");
    return ok;
}

bool test_remove_and_query() {
    IntervalStore store;
    auto a = store.create(5.0, 6.0, "late");
    auto b = store.create(1.0, 2.0, "early");
    auto c = store.create(1.0, 3.0, "tie");
    auto all = store.all();
    bool ok = check(all.size() == 3, "three intervals");
    ok &= check(all[0].id == b && all[1].id == c && all[2].id == a,
                "sorted by start, ties keep creation order");

    auto filtered = store.query([](const SubtitleInterval &s) { return s.start < 2.0; });
    ok &= check(filtered.size() == 2, "predicate filters");

    store.remove(b);
    store.remove(b);
    ok &= check(store.size() == 2 && !store.contains(b), "remove is idempotent");
    store.remove("nope");
    ok &= check(store.size() == 2, "unknown remove ignored");
    return ok;
}

bool test_restore() {
    IntervalStore store;
    SubtitleInterval s{"subtitle-1", 0.0, 2.0, "kept"};
    bool ok = check(store.restore(s), "restore with id");
    ok &= check(!store.restore(s), "duplicate id refused");
    SubtitleInterval bad{"x", 3.0, 1.0, ""};
    ok &= check(!store.restore(bad), "inverted range refused");
    auto next = store.create(3.0, 4.0);
    ok &= check(next == "subtitle-2", "generated ids skip restored ones");

    store.clear();
    ok &= check(store.empty(), "clear empties the store");
    ok &= check(store.create(0.0, 1.0) == "subtitle-1", "clear resets id counter");
    return ok;
}

bool test_time_limit() {
    IntervalStore store;
    bool threw = false;
    try {
        store.create(1e19, 1e19 + 1e6);
    } catch (const InvalidRangeError &) {
        threw = true;
    }
    bool ok = check(threw, "times above 99:59:59.999 rejected on create");
    ok &= check(!store.restore({"far", 0.0, kMaxTime + 1.0, ""}), "restore above the limit refused");

    auto id = store.create(10.0, 12.0);
    ok &= check(!store.update(id, IntervalPatch{1e300, std::nullopt, std::nullopt}),
                "update above the limit rejected");
    ok &= check(store.update(id, IntervalPatch{kMaxTime, std::nullopt, std::nullopt}),
                "update at the limit accepted");
    auto s = store.get(id);
    ok &= check(s && s->end <= kMaxTime && valid(*s), "carried end stays within the limit");

    auto top = store.create(kMaxTime - 0.05, kMaxTime);
    s = store.get(top);
    ok &= check(s && std::isfinite(s->end) && s->end <= kMaxTime && valid(*s),
                "minimum duration at the limit moves start back");
    return ok;
}

}  // namespace

int main() {
    set_log_verbosity(LogVerbosity::Error);
    bool ok = true;
    ok &= test_create();
    ok &= test_update_rules();
    ok &= test_remove_and_query();
    ok &= test_restore();
    ok &= test_time_limit();
    if (ok) {
        std::cout << "interval_store_unit OK\n";
    }
    return ok ? 0 : 1;
}
