#include "test_framework.hpp"
#include "tests/helpers/test_helpers.hpp"

#include "ragvix/corpus/chunker.hpp"
#include "ragvix/index/vector_index.hpp"
#include "ragvix/observability/factory.hpp"
#include "ragvix/observability/global.hpp"
#include "ragvix/observability/multi_observer.hpp"
#include "ragvix/observability/noop_observer.hpp"

#include <chrono>
#include <memory>
#include <string>
#include <variant>
#include <vector>

namespace {

namespace ob = ragvix::observability;

struct Captured {
  std::vector<ob::ObserverEvent> events;
  std::vector<ob::ObserverMetric> metrics;

  template <typename T> [[nodiscard]] std::vector<T> events_of() const {
    std::vector<T> out;
    for (const auto &event : events) {
      if (const auto *typed = std::get_if<T>(&event); typed != nullptr) {
        out.push_back(*typed);
      }
    }
    return out;
  }
};

class CapturingObserver final : public ob::IObserver {
public:
  explicit CapturingObserver(Captured *state) : state_(state) {}

  void record_event(const ob::ObserverEvent &event) override { state_->events.push_back(event); }
  void record_metric(const ob::ObserverMetric &metric) override {
    state_->metrics.push_back(metric);
  }
  [[nodiscard]] std::string_view name() const override { return "capturing"; }

private:
  Captured *state_ = nullptr;
};

// Installs a capturing observer for the lifetime of the guard.
struct ObserverGuard {
  explicit ObserverGuard(Captured *state) {
    ob::set_global_observer(std::make_unique<CapturingObserver>(state));
  }
  ~ObserverGuard() { ob::set_global_observer(nullptr); }
};

} // namespace

void register_observability_tests(std::vector<ragvix::tests::TestCase> &tests) {
  using ragvix::tests::require;

  tests.push_back({"observability_global_noop", [] {
                     ob::set_global_observer(std::make_unique<ob::NoopObserver>());
                     require(ob::get_global_observer() != nullptr, "observer should be set");
                     require(ob::get_global_observer()->name() == "noop", "expected noop observer");
                     ob::record_search(5, 3, std::chrono::milliseconds(2));
                     ob::record_metric(ob::IndexSizeMetric{.chunks = 42});
                     ob::set_global_observer(nullptr);
                     require(ob::get_global_observer() == nullptr, "observer cleared");
                     ob::record_error("unit", "dropped without an observer");
                   }});

  tests.push_back({"observability_multi_forwards_to_children", [] {
                     Captured one;
                     Captured two;
                     auto multi = std::make_unique<ob::MultiObserver>();
                     multi->add(std::make_unique<CapturingObserver>(&one));
                     multi->add(std::make_unique<CapturingObserver>(&two));

                     ob::set_global_observer(std::move(multi));
                     ob::record_event(ob::ErrorEvent{.component = "unit", .message = "boom"});
                     ob::record_metric(ob::SearchLatencyMetric{.latency = std::chrono::milliseconds(3)});

                     require(one.events.size() == 1 && two.events.size() == 1,
                             "event should be forwarded");
                     require(one.metrics.size() == 1 && two.metrics.size() == 1,
                             "metric should be forwarded");
                     ob::set_global_observer(nullptr);
                   }});

  tests.push_back({"observability_factory_selects_backend", [] {
                     ragvix::config::Config config;
                     config.observability.backend = "none";
                     require(ob::create_observer(config)->name() == "noop",
                             "none backend should map to noop");
                     config.observability.backend = "LOG";
                     require(ob::create_observer(config)->name() == "log", "log backend");
                     config.observability.backend = "log,noop";
                     auto multi = ob::create_observer(config);
                     require(multi->name() == "multi", "comma list gives multi observer");
                     require(static_cast<ob::MultiObserver *>(multi.get())->size() == 2,
                             "two children");
                   }});

  tests.push_back({"observability_chunker_reports_chunk_count", [] {
                     Captured captured;
                     ObserverGuard guard(&captured);
                     ragvix::corpus::Document doc;
                     doc.id = "obs";
                     doc.text = "one two three four five";
                     const auto chunks = ragvix::corpus::chunk_document(
                         doc, ragvix::corpus::ChunkingOptions{
                                  .window_size = 2,
                                  .overlap = 0,
                                  .unit = ragvix::corpus::ChunkUnit::Tokens});
                     require(chunks.ok(), chunks.error());
                     const auto events = captured.events_of<ob::ChunkingEvent>();
                     require(events.size() == 1, "one chunking event");
                     require(events[0].document_id == "obs" && events[0].chunk_count == 3,
                             "event carries document and count");
                   }});

  tests.push_back({"observability_index_reports_mutations_and_size", [] {
                     Captured captured;
                     ObserverGuard guard(&captured);
                     namespace vindex = ragvix::index;
                     auto built = vindex::VectorIndex::build(
                         vindex::IndexOptions{},
                         {ragvix::testing::make_embedded("a", 0, {1.0F, 0.0F}),
                          ragvix::testing::make_embedded("a", 1, {0.0F, 1.0F})});
                     require(built.ok(), built.error());
                     auto added = built.value()->add(
                         {ragvix::testing::make_embedded("a", 1, {0.0F, 1.0F}),
                          ragvix::testing::make_embedded("b", 0, {1.0F, 1.0F})});
                     require(added.ok(), added.error());

                     const auto mutations = captured.events_of<ob::IndexMutationEvent>();
                     require(mutations.size() == 2, "build and add events");
                     require(mutations[0].operation == "build" && mutations[0].added == 2,
                             "build event");
                     require(mutations[1].operation == "add" && mutations[1].added == 1 &&
                                 mutations[1].skipped == 1 && mutations[1].total == 3,
                             "add event");
                     const auto &last = captured.metrics.back();
                     require(std::holds_alternative<ob::IndexSizeMetric>(last) &&
                                 std::get<ob::IndexSizeMetric>(last).chunks == 3,
                             "index size metric");
                   }});
}
