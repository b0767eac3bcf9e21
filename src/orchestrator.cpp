#include "orchestrator.h"

#include "errors.h"
#include "profile.h"
#include "stack_loader.h"
#include "trace.h"
#include "tui.h"
#include "workspace.h"

#include <tbb/flow_graph.h>
#include <tbb/global_control.h>

#include <algorithm>
#include <map>
#include <optional>
#include <set>
#include <utility>

namespace strata {

namespace {

constexpr char kDefaultStacksDir[]{ "stacks" };

std::string join(std::vector<std::string> const &names) {
  std::string out;
  for (auto const &n : names) {
    if (!out.empty()) { out += ", "; }
    out += n;
  }
  return out;
}

// Body of one graph node. Never throws: every outcome is recorded in the run.
// A stack starts only once every gate stack succeeded; relation names the
// gates in the skip detail.
void apply_stack(provision_run &run,
                 provider_set const &providers,
                 stack_spec const &stack,
                 std::vector<std::string> const &gates,
                 char const *relation) {
  for (auto const &gate : gates) {
    if (auto const s{ run.status(gate) }; s != stack_status::succeeded) {
      run.skip(stack.name,
               std::string(relation) + " '" + gate + "' " + std::string(stack_status_name(s)));
      return;
    }
  }

  if (!run.try_start(stack.name)) { return; }

  stack_status status{ stack_status::failed };
  std::string detail;
  std::optional<apply_result> result;

  apply_ctx ctx{ [&run, &stack] { return run.cancel_requested(stack.name); } };
  provider *p{ nullptr };
  try {
    p = &providers.for_stack(stack);
    provider_call_trace_scope scope{ stack.name, std::string(p->name()), "apply" };
    ctx.checkpoint();
    result = p->apply(stack, ctx);
    scope.succeeded();
    status = stack_status::succeeded;
    detail = result->describe();
  } catch (cancelled_error const &e) {
    status = stack_status::cancelled;
    detail = e.what();
  } catch (std::exception const &e) {
    provider_error const err{ error_kind::provider_apply_error,
                              p ? std::string(p->name()) : stack.provider,
                              stack.name,
                              e.what() };
    detail = err.what();
  }

  try {
    run.finish(stack.name, status, std::move(detail), std::move(result));
  } catch (std::exception const &e) {
    tui::error("[%s] %s", stack.name.c_str(), e.what());
  }
}

// A stack whose state cannot be read fails on its own; its dependents are
// skipped at apply time and independent stacks go on.
observed_cache_t refresh_stacks(provision_run &run, provider_set const &providers) {
  observed_cache_t refreshed;
  for (auto const &stack : run.stacks()) {
    try {
      refreshed[stack.name] = provider_refresh(providers.for_stack(stack), stack);
    } catch (provider_error const &e) {
      run.fail_pending(stack.name, e.what());
    }
  }
  return refreshed;
}

std::vector<preview_result> preview_pending(provision_run &run,
                                            provider_set const &providers,
                                            observed_cache_t const *refreshed) {
  std::vector<preview_result> previews;
  for (auto const &stack : run.stacks()) {
    if (run.status(stack.name) != stack_status::pending) { continue; }
    try {
      auto one{ preview_stacks({ stack }, providers, refreshed) };
      previews.push_back(std::move(one.front()));
    } catch (provider_error const &e) {
      run.fail_pending(stack.name, e.what());
    }
  }
  return previews;
}

// Named stacks only (all when names is empty), keeping dependency order.
std::vector<stack_spec> select_targets(std::vector<stack_spec> stacks,
                                       std::vector<std::string> const &names) {
  if (names.empty()) { return stacks; }
  std::erase_if(stacks, [&](stack_spec const &s) {
    return std::find(names.begin(), names.end(), s.name) == names.end();
  });
  return stacks;
}

}  // namespace

provision_params::provision_params(std::vector<std::string> stacks,
                                   provision_flags flags,
                                   std::optional<std::filesystem::path> stacks_dir,
                                   std::optional<std::string> profile)
    : stacks_{ std::move(stacks) },
      flags_{ flags },
      stacks_dir_{ std::move(stacks_dir) },
      profile_{ std::move(profile) } {
  std::set<std::string> seen;
  for (auto const &name : stacks_) {
    if (!stack_name_valid(name)) {
      throw config_error(error_kind::invalid_params, "invalid stack name '" + name + "'");
    }
    if (!seen.insert(name).second) {
      throw config_error(error_kind::invalid_params, "stack '" + name + "' named twice");
    }
  }
  if (profile_ && !profile_name_valid(*profile_)) {
    throw config_error(error_kind::invalid_params, "invalid profile name '" + *profile_ + "'");
  }
  if (stacks_dir_ && stacks_dir_->empty()) {
    throw config_error(error_kind::invalid_params, "stacks directory must not be empty");
  }
}

struct orchestrator::resolved_stacks {
  std::vector<stack_spec> stacks;
  std::unique_ptr<provider_set> providers;
};

orchestrator::orchestrator(provider_registry registry) : registry_{ std::move(registry) } {}

orchestrator::~orchestrator() = default;

void orchestrator::init(init_params const &params) {
  std::lock_guard lock{ mutex_ };
  if (params_) {
    if (*params_ == params) { return; }
    throw config_error(error_kind::already_initialized,
                       "already initialized with different parameters (profile '" +
                           params_->profile + "')");
  }

  if (!profile_name_valid(params.profile)) {
    throw config_error(error_kind::invalid_params,
                       "invalid profile name '" + params.profile + "'");
  }

  root_ = workspace_resolve_root(params.root);
  secrets_ = std::make_unique<secret_store>(root_, params.profile);
  params_ = params;
  tui::debug("Initialized: root=%s profile=%s",
             root_.string().c_str(),
             params.profile.c_str());
}

bool orchestrator::initialized() const {
  std::lock_guard lock{ mutex_ };
  return params_.has_value();
}

void orchestrator::require_initialized() const {
  if (!initialized()) {
    throw config_error(error_kind::not_initialized, "init must be called first");
  }
}

std::filesystem::path const &orchestrator::root() const {
  require_initialized();
  return root_;
}

std::string const &orchestrator::profile() const {
  require_initialized();
  return params_->profile;
}

secret_store &orchestrator::secrets() {
  require_initialized();
  return *secrets_;
}

void orchestrator::check_profile(provision_params const &params) const {
  if (params.profile() && *params.profile() != params_->profile) {
    throw config_error(error_kind::invalid_params,
                       "profile '" + *params.profile() +
                           "' does not match the initialized profile '" +
                           params_->profile + "'");
  }
}

std::filesystem::path orchestrator::stacks_root(provision_params const &params) {
  require_initialized();

  if (params.stacks_dir()) { return root_ / *params.stacks_dir(); }
  if (params_->stacks_dir) { return root_ / *params_->stacks_dir; }

  secrets_->read_profile_config();
  if (auto const &dir{ secrets_->loaded_profile().stacks_dir }) { return *dir; }
  return root_ / kProfileDir / kDefaultStacksDir;
}

orchestrator::resolved_stacks orchestrator::resolve(provision_params const &params,
                                                    std::uint64_t run_id) {
  try {
    STRATA_TRACE_RUN_PHASE(run_id, run_phase_name(run_phase::initializing));
    secrets_->read_profile_config();
    auto const dir{ stacks_root(params) };
    auto const secrets{ secrets_->read_secret_files(dir) };

    STRATA_TRACE_RUN_PHASE(run_id, run_phase_name(run_phase::loading));
    auto stacks{ load_stacks(dir, params.stacks()) };

    for (auto &stack : stacks) {
      for (auto &resource : stack.resources) {
        for (auto &[key, value] : resource.properties) {
          try {
            value = secrets.resolve_placeholders(value);
          } catch (credential_error const &e) {
            throw credential_error(e.kind(),
                                   "stack '" + stack.name + "' resource " + resource.key() +
                                       " property '" + key + "': " + e.what());
          }
        }
      }
    }

    auto providers{ std::make_unique<provider_set>(registry_, secrets, root_, stacks) };
    tui::info("Loaded %zu stack(s) from %s", stacks.size(), dir.string().c_str());
    return { std::move(stacks), std::move(providers) };
  } catch (...) {
    STRATA_TRACE_RUN_PHASE(run_id, run_phase_name(run_phase::failed));
    throw;
  }
}

void orchestrator::register_run(std::shared_ptr<provision_run> const &run) {
  std::lock_guard lock{ mutex_ };
  for (auto const &active : active_runs_) {
    for (auto const &stack : run->stacks()) {
      if (active->contains(stack.name)) {
        throw config_error(error_kind::run_conflict,
                           "stack '" + stack.name + "' is already being provisioned by run " +
                               std::to_string(active->id()));
      }
    }
  }
  active_runs_.push_back(run);
}

void orchestrator::unregister_run(std::shared_ptr<provision_run> const &run) {
  std::lock_guard lock{ mutex_ };
  std::erase(active_runs_, run);
}

std::uint64_t orchestrator::next_run_id() {
  std::lock_guard lock{ mutex_ };
  return next_run_id_++;
}

provision_report orchestrator::provision(provision_params const &params,
                                         provision_options const &options) {
  return execute(params, options, run_mode::provision);
}

provision_report orchestrator::destroy(provision_params const &params,
                                       provision_options const &options) {
  return execute(params, options, run_mode::destroy);
}

provision_report orchestrator::execute(provision_params const &params,
                                       provision_options const &options,
                                       run_mode mode) {
  require_initialized();
  check_profile(params);

  auto const run_id{ next_run_id() };
  auto resolved{ resolve(params, run_id) };
  auto const &providers{ *resolved.providers };

  if (mode == run_mode::destroy) {
    resolved.stacks = select_targets(std::move(resolved.stacks), params.stacks());
    for (auto &stack : resolved.stacks) { stack.resources.clear(); }
  }

  auto const run{ std::make_shared<provision_run>(run_id, resolved.stacks, options.token) };
  register_run(run);

  struct registration {
    orchestrator &o;
    std::shared_ptr<provision_run> const &r;
    ~registration() { o.unregister_run(r); }
  } const registered{ *this, run };

  auto const &flags{ params.flags() };
  std::vector<preview_result> previews;

  try {
    observed_cache_t refreshed;
    if (!flags.skip_refresh()) {
      run->set_phase(run_phase::refreshing);
      refreshed = refresh_stacks(*run, providers);
    }

    if (!flags.skip_preview()) {
      run->set_phase(run_phase::previewing);
      previews = preview_pending(*run, providers, flags.skip_refresh() ? nullptr : &refreshed);

      bool const approved{ !options.confirm || options.confirm(previews) };
      if (!approved) {
        run->cancel_pending("preview declined");
        run->set_phase(run_phase::cancelled);
      }
    }

    if (run->phase() != run_phase::cancelled) {
      if (options.token && options.token->requested()) {
        run->cancel_pending("cancelled before apply");
        run->set_phase(run_phase::cancelled);
      } else {
        run->set_phase(run_phase::applying);
        apply(*run, providers, mode);
        run->settle();
      }
    }
  } catch (...) {
    run->set_phase(run_phase::failed);
    throw;
  }

  auto report{ run->report() };
  report.previews = std::move(previews);
  report.previewed = !flags.skip_preview();
  return report;
}

void orchestrator::apply(provision_run &run,
                         provider_set const &providers,
                         run_mode mode) const {
  using continue_node_t = tbb::flow::continue_node<tbb::flow::continue_msg>;

  std::optional<tbb::global_control> limit;
  if (params_->max_parallelism > 0) {
    limit.emplace(tbb::global_control::max_allowed_parallelism, params_->max_parallelism);
  }

  tbb::flow::graph g;
  tbb::flow::broadcast_node<tbb::flow::continue_msg> start{ g };

  // Destroy runs the dependency edges backwards: a stack waits for every
  // dependent in the run instead of for its dependencies.
  bool const reverse{ mode == run_mode::destroy };
  std::map<std::string, std::vector<std::string>> gates;
  for (auto const &stack : run.stacks()) {
    gates.try_emplace(stack.name);
    for (auto const &dep : stack.dependencies) {
      if (!reverse) {
        gates[stack.name].push_back(dep);
      } else if (run.contains(dep)) {
        gates[dep].push_back(stack.name);
      }
    }
  }
  char const *relation{ reverse ? "dependent" : "dependency" };

  std::map<std::string, std::unique_ptr<continue_node_t>> nodes;
  for (auto const &stack : run.stacks()) {
    auto const &stack_gates{ gates.at(stack.name) };
    nodes.emplace(
        stack.name,
        std::make_unique<continue_node_t>(
            g,
            [&run, &providers, &stack, &stack_gates, relation](
                tbb::flow::continue_msg const &) {
              apply_stack(run, providers, stack, stack_gates, relation);
            }));
  }

  for (auto const &stack : run.stacks()) {
    auto &node{ *nodes.at(stack.name) };
    auto const &stack_gates{ gates.at(stack.name) };
    if (stack_gates.empty()) {
      tbb::flow::make_edge(start, node);
    } else {
      for (auto const &gate : stack_gates) { tbb::flow::make_edge(*nodes.at(gate), node); }
    }
  }

  start.try_put(tbb::flow::continue_msg{});
  g.wait_for_all();
}

std::vector<preview_result> orchestrator::preview_provision(provision_params const &params) {
  require_initialized();
  check_profile(params);

  auto const run_id{ next_run_id() };

  auto const resolved{ resolve(params, run_id) };

  try {
    observed_cache_t refreshed;
    if (!params.flags().skip_refresh()) {
      STRATA_TRACE_RUN_PHASE(run_id, run_phase_name(run_phase::refreshing));
      for (auto const &stack : resolved.stacks) {
        refreshed[stack.name] = provider_refresh(resolved.providers->for_stack(stack), stack);
      }
    }

    STRATA_TRACE_RUN_PHASE(run_id, run_phase_name(run_phase::previewing));
    auto results{ preview_stacks(resolved.stacks,
                                 *resolved.providers,
                                 params.flags().skip_refresh() ? nullptr : &refreshed) };
    STRATA_TRACE_RUN_PHASE(run_id, run_phase_name(run_phase::completed));
    return results;
  } catch (...) {
    STRATA_TRACE_RUN_PHASE(run_id, run_phase_name(run_phase::failed));
    throw;
  }
}

std::vector<stack_outputs> orchestrator::outputs(provision_params const &params) {
  require_initialized();
  check_profile(params);

  auto const run_id{ next_run_id() };
  auto const resolved{ resolve(params, run_id) };

  try {
    std::vector<stack_outputs> out;
    for (auto const &stack : select_targets(resolved.stacks, params.stacks())) {
      out.push_back(stack_outputs{
          .stack = stack.name,
          .provider = stack.provider,
          .state = provider_query_state(resolved.providers->for_stack(stack), stack) });
    }
    STRATA_TRACE_RUN_PHASE(run_id, run_phase_name(run_phase::completed));
    return out;
  } catch (...) {
    STRATA_TRACE_RUN_PHASE(run_id, run_phase_name(run_phase::failed));
    throw;
  }
}

std::size_t orchestrator::cancel(stack_params const &params) {
  require_initialized();

  std::size_t affected{ 0 };
  {
    std::lock_guard lock{ mutex_ };
    for (auto const &run : active_runs_) { affected += run->cancel(params.stacks); }
  }

  if (affected == 0) {
    throw no_active_run_error(params.stacks.empty()
                                  ? std::string{ "no active run" }
                                  : "no pending or running stack matches: " +
                                        join(params.stacks));
  }
  tui::info("Cancellation requested for %zu stack(s)", affected);
  return affected;
}

}  // namespace strata
