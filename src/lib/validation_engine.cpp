#include <shacl/validation_engine.hpp>

#include <shacl/basic_query_executor.hpp>
#include <shacl/constraint_validators.hpp>
#include <shacl/deadline_watchdog.hpp>
#include <shacl/logging.hpp>
#include <shacl/rule_validator.hpp>
#include <shacl/thread_pool.hpp>
#include <shacl/vocabulary.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <iterator>
#include <latch>
#include <optional>
#include <unordered_set>

namespace shacl {

  namespace {

    struct unit {
      const node_shape* shape;
      term focus_node;
    };

    void
    check_stop(const std::stop_token& stop) {
      if (stop.stop_requested()) {
        throw unit_timeout("unit exceeded its time limit");
      }
    }

    void
    append(std::vector<validation_result>& out,
           std::vector<validation_result> more) {
      std::move(more.begin(), more.end(), std::back_inserter(out));
    }

    validation_result
    engine_error(const unit& u, std::string_view failure,
                 const std::string& reason) {
      validation_result r;
      r.focus_node = u.focus_node;
      r.source_shape = u.shape->id;
      r.severity = severity::engine_error;
      r.message = "Validation of " + u.focus_node.to_string() + " against " +
                  u.shape->id.to_string() + " did not complete: " + reason;
      r.details.set("failure", std::string(failure));
      r.details.set("reason", reason);
      return r;
    }

    // Wraps a unit so every failure other than a configuration problem
    // becomes one engine_error result.
    template <typename Evaluate>
    std::vector<validation_result>
    guarded(const unit& u, const std::stop_source& stop, Evaluate&& evaluate) {
      std::optional<validation_result> failed;
      try {
        return evaluate(stop.get_token());
      } catch (const unit_timeout& e) {
        failed = engine_error(u, "timeout", e.what());
      } catch (const query_error& e) {
        // A cancelled query is the timeout surfacing through the executor.
        failed = stop.stop_requested()
                     ? engine_error(u, "timeout", e.what())
                     : engine_error(u, "query_error", e.what());
      } catch (const std::exception& e) {
        failed = engine_error(u, "exception", e.what());
      } catch (...) {
        failed = engine_error(u, "exception", "unknown exception");
      }
      spdlog::warn("{}", failed->message);
      return {std::move(*failed)};
    }

  } // namespace

  validation_engine::validation_engine()
      : executor_(std::make_shared<basic_query_executor>()) {}

  validation_engine::validation_engine(
      std::shared_ptr<const query_executor> executor)
      : executor_(std::move(executor)) {
    if (!executor_) {
      throw std::invalid_argument("validation_engine: null query executor");
    }
  }

  std::vector<term>
  validation_engine::select_targets(const graph& g, const node_shape& shape) {
    std::vector<term> targets;
    std::unordered_set<term> seen;
    auto type = term::make_iri(std::string(vocab::rdf::type));

    auto add_instances = [&](const iri& cls) {
      for (auto& s : g.subjects(type, term(cls))) {
        if (seen.insert(s).second) targets.push_back(std::move(s));
      }
    };

    for (const auto& cls : shape.target_classes) {
      add_instances(cls);
    }
    if (shape.implicit_class_target) add_instances(*shape.implicit_class_target);
    return targets;
  }

  std::vector<validation_result>
  validation_engine::evaluate_unit(const graph& g, const node_shape& shape,
                                   const term& focus_node,
                                   std::stop_token stop) const {
    std::vector<validation_result> results;

    for (const auto& ps : shape.property_shapes) {
      check_stop(stop);
      append(results, validators::validate_cardinality(g, focus_node, ps));
      check_stop(stop);
      append(results, validators::validate_type(g, focus_node, ps));
      check_stop(stop);
      append(results, validators::validate_string(g, focus_node, ps));
      check_stop(stop);
      append(results, validators::validate_value(g, focus_node, ps));
      check_stop(stop);
      append(results, validators::validate_qualified(g, focus_node, ps));
    }

    check_stop(stop);
    append(results, validate_rules(g, focus_node, shape.rule_constraints,
                                   *executor_, stop));
    check_stop(stop);
    return results;
  }

  validation_report
  validation_engine::run(const graph& g, const std::vector<node_shape>& shapes,
                         const validation_options& options) const {
    validate_options(options);
    std::optional<scoped_log_level> log_level;
    if (options.log_level) log_level.emplace(*options.log_level);

    std::vector<unit> units;
    for (const auto& shape : shapes) {
      for (auto& focus : select_targets(g, shape)) {
        units.push_back(unit{&shape, std::move(focus)});
      }
    }

    spdlog::debug("validating {} shape(s), {} unit(s), {} mode", shapes.size(),
                  units.size(), options.parallel ? "parallel" : "sequential");

    // One slot per unit keeps the assembled order independent of scheduling.
    std::vector<std::vector<validation_result>> slots(units.size());

    std::optional<deadline_watchdog> watchdog;
    if (options.timeout) watchdog.emplace();

    auto run_unit = [&](std::size_t i) {
      const auto& u = units[i];
      spdlog::trace("unit {}: {} against {}", i, u.focus_node.to_string(),
                    u.shape->id.to_string());

      std::stop_source stop;
      std::optional<deadline_watchdog::handle> watched;
      if (watchdog) {
        watched = watchdog->watch(
            stop, deadline_watchdog::clock::now() + *options.timeout);
      }
      slots[i] = guarded(u, stop, [&](std::stop_token token) {
        return evaluate_unit(g, *u.shape, u.focus_node, token);
      });
      if (watched) watchdog->release(*watched);
    };

    if (!options.parallel || units.empty()) {
      for (std::size_t i = 0; i < units.size(); ++i) {
        run_unit(i);
      }
    } else {
      auto workers = std::min<std::size_t>(
          static_cast<std::size_t>(effective_concurrency(options)),
          units.size());
      std::latch done(static_cast<std::ptrdiff_t>(units.size()));
      {
        thread_pool pool(workers);
        for (std::size_t i = 0; i < units.size(); ++i) {
          pool.add_task([&, i] {
            run_unit(i);
            done.count_down();
          });
        }
        done.wait();
      }
    }

    std::vector<validation_result> results;
    for (auto& slot : slots) {
      append(results, std::move(slot));
    }
    validation_report report(std::move(results));

    spdlog::info("validation finished: {} violation(s), {} engine error(s)",
                 report.count(severity::violation),
                 report.count(severity::engine_error));
    spdlog::debug("validation status: {}", to_string(report.status()));
    return report;
  }

  validation_report
  validate(const graph& g, const std::vector<node_shape>& shapes,
           const validation_options& options) {
    return validation_engine().run(g, shapes, options);
  }

} // namespace shacl
