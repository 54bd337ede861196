#include "test_framework.hpp"

#include "selfspy/capture/window_deduplicator.hpp"
#include "tests/helpers/test_helpers.hpp"

void register_window_deduplicator_tests(std::vector<selfspy::tests::TestCase> &tests) {
  using selfspy::tests::require;
  using selfspy::capture::WindowDeduplicator;
  using selfspy::capture::WindowState;
  using selfspy::testing::window_event;
  using selfspy::testing::window_key;

  tests.push_back({"repeated_observation_keeps_one_record", [] {
                     WindowDeduplicator dedup;
                     require(dedup.observe(window_event("Doc", "Editor", 10, 100)) == 1,
                             "first observation creates a record");
                     require(dedup.observe(window_event("Doc", "Editor", 10, 200)) == 0,
                             "repeat should not create a record");
                     require(dedup.observe(window_event("Doc", "Editor", 10, 150)) == 0,
                             "out-of-order repeat should not create a record");
                     require(dedup.pending() == 1, "one pending record");

                     const auto records = dedup.close_all();
                     require(records.size() == 1, "one record drained");
                     require(records[0].first_seen_ms == 100, "first seen is the minimum");
                     require(records[0].last_seen_ms == 200, "last seen is the maximum");
                     require(records[0].state == WindowState::Closed, "drained records are closed");
                   }});

  tests.push_back({"state_transitions_unseen_open_closed", [] {
                     WindowDeduplicator dedup;
                     const auto key = window_key("Doc", "Editor", 10);
                     require(dedup.state(key) == WindowState::Unseen, "starts unseen");
                     (void)dedup.observe(window_event("Doc", "Editor", 10, 100));
                     require(dedup.state(key) == WindowState::Open, "open after observation");
                     (void)dedup.close_all();
                     require(dedup.state(key) == WindowState::Closed, "closed after drain");
                   }});

  tests.push_back({"same_title_different_pid_is_distinct", [] {
                     WindowDeduplicator dedup;
                     (void)dedup.observe(window_event("Doc", "Editor", 10, 100));
                     (void)dedup.observe(window_event("Doc", "Editor", 11, 200));
                     require(dedup.pending() == 2, "pid is part of the key");
                   }});

  tests.push_back({"focus_switch_extends_previous_window", [] {
                     WindowDeduplicator dedup;
                     (void)dedup.observe(window_event("A", "App", 1, 1000));
                     (void)dedup.observe(window_event("B", "Other", 2, 5000));
                     const auto records = dedup.close_all();
                     require(records.size() == 2, "two records");
                     require(records[0].key.title == "A", "order preserved");
                     require(records[0].last_seen_ms == 5000, "A extends to the switch");
                     require(records[1].first_seen_ms == 5000 && records[1].last_seen_ms == 5000,
                             "B starts at the switch");
                   }});

  tests.push_back({"focused_window_continues_after_drain", [] {
                     WindowDeduplicator dedup;
                     (void)dedup.observe(window_event("A", "App", 1, 1000));
                     (void)dedup.close_all();
                     require(dedup.current_record().has_value(), "focused window is remembered");

                     require(dedup.observe(window_event("A", "App", 1, 2000)) == 1,
                             "polled window creates a record");
                     const auto records = dedup.close_all();
                     require(records.size() == 1, "one record");
                     require(records[0].continuation, "record continues the stored row");
                   }});

  tests.push_back({"switch_away_from_carried_window_emits_extension", [] {
                     WindowDeduplicator dedup;
                     (void)dedup.observe(window_event("A", "App", 1, 1000));
                     (void)dedup.close_all();

                     require(dedup.observe(window_event("B", "Other", 2, 4000)) == 2,
                             "extension for A plus new B");
                     const auto records = dedup.close_all();
                     require(records.size() == 2, "two records");
                     require(records[0].key.title == "A" && records[0].continuation,
                             "A extension");
                     require(records[0].last_seen_ms == 4000, "A extended to the switch");
                     require(records[1].key.title == "B" && !records[1].continuation,
                             "B is new");
                   }});

  tests.push_back({"returning_window_after_drain_is_new_row", [] {
                     WindowDeduplicator dedup;
                     (void)dedup.observe(window_event("A", "App", 1, 1000));
                     (void)dedup.observe(window_event("B", "Other", 2, 2000));
                     (void)dedup.close_all();
                     (void)dedup.observe(window_event("A", "App", 1, 3000));
                     const auto records = dedup.close_all();
                     // B's extension, then a fresh visit to A.
                     require(records.size() == 2, "two records");
                     require(records[0].key.title == "B" && records[0].continuation,
                             "B extension");
                     require(records[1].key.title == "A" && !records[1].continuation,
                             "A starts a new row");
                   }});

  tests.push_back({"blur_extends_focused_window_and_clears_focus", [] {
                     WindowDeduplicator dedup;
                     (void)dedup.observe(window_event("A", "App", 1, 1000));
                     require(dedup.blur(6000) == 0, "open record is extended in place");
                     require(!dedup.current().has_value(), "nothing holds the focus");
                     require(dedup.blur(7000) == 0, "second blur is a no-op");

                     const auto records = dedup.close_all();
                     require(records.size() == 1, "one record");
                     require(records[0].last_seen_ms == 6000, "extended to the blur");
                   }});

  tests.push_back({"blur_after_drain_emits_extension_when_allowed", [] {
                     WindowDeduplicator dedup;
                     (void)dedup.observe(window_event("A", "App", 1, 1000));
                     (void)dedup.close_all();
                     require(dedup.blur(3000, false) == 0, "suppressed at the hard cap");
                     require(dedup.pending() == 0, "nothing pending");

                     (void)dedup.observe(window_event("A", "App", 1, 4000));
                     (void)dedup.close_all();
                     require(dedup.blur(5000) == 1, "extension row for the carried window");
                     const auto records = dedup.close_all();
                     require(records.size() == 1 && records[0].continuation, "continuation");
                     require(records[0].last_seen_ms == 5000, "extended to the blur");
                   }});
}
