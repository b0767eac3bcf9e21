#include "cli.h"
#include "tui.h"

#include "CLI/CLI.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace strata {

cli_args cli_parse(int argc, char **argv) {
  CLI::App app{ "strata - infrastructure provisioning orchestrator" };
  app.allow_windows_style_options(false);

  cli_args args{};

  bool verbose{ false };
  app.add_flag(
      "--verbose",
      verbose,
      "Enable decorated verbose logging (prefix stdout/stderr with timestamp and level)");

  std::string trace_spec;
  auto *trace_option{ app.add_option("--trace",
                                     trace_spec,
                                     "Enable trace logging. Provide a comma-separated "
                                     "list: 'stderr' for human-readable stderr and/or "
                                     "'file:<path>' for JSONL file output. Defaults to "
                                     "stderr if no value provided.") };
  trace_option->expected(0, 1);

  app.add_option("--root",
                 args.globals.root,
                 "Workspace root (discovered from the current directory if omitted)");
  app.add_option("--profile", args.globals.profile, "Credential profile name")
      ->capture_default_str();

  bool version_flag_short{ false };
  bool version_flag_long{ false };
  app.add_flag("-v",
               version_flag_short,
               "Show version information (alias for version subcommand)");
  app.add_flag("--version",
               version_flag_long,
               "Show version information (alias for version subcommand)");

  std::optional<cli_args::cmd_cfg_t> cmd_cfg;

  auto *version{ app.add_subcommand("version", "Show version information") };
  version->callback([&cmd_cfg] { cmd_cfg = cmd_version::cfg{}; });

  // Provision subcommand
  cmd_provision::cfg provision_cfg{};
  auto *provision{ app.add_subcommand("provision",
                                      "Refresh, preview and apply stacks") };
  provision->add_option("stacks",
                        provision_cfg.stacks,
                        "Stacks to provision (all if omitted)");
  provision->add_option("--stacks-dir",
                        provision_cfg.stacks_dir,
                        "Stacks directory, relative to the workspace root");
  provision->add_flag("--skip-refresh",
                      provision_cfg.skip_refresh,
                      "Do not refresh provider state before previewing");
  provision->add_flag("--skip-preview",
                      provision_cfg.skip_preview,
                      "Apply without computing or confirming a preview");
  provision->add_flag("-y,--yes", provision_cfg.yes, "Apply without prompting");
  provision->add_option("-j,--jobs", provision_cfg.jobs, "Maximum stacks applied at once")
      ->check(CLI::NonNegativeNumber);
  provision->callback([&cmd_cfg, &provision_cfg] { cmd_cfg = provision_cfg; });

  // Preview subcommand
  cmd_preview::cfg preview_cfg{};
  auto *preview{ app.add_subcommand("preview", "Show what provision would change") };
  preview->add_option("stacks", preview_cfg.stacks, "Stacks to preview (all if omitted)");
  preview->add_option("--stacks-dir",
                      preview_cfg.stacks_dir,
                      "Stacks directory, relative to the workspace root");
  preview->add_flag("--skip-refresh",
                    preview_cfg.skip_refresh,
                    "Diff against provider state without refreshing it");
  preview->callback([&cmd_cfg, &preview_cfg] { cmd_cfg = preview_cfg; });

  // Destroy subcommand
  cmd_destroy::cfg destroy_cfg{};
  auto *destroy{ app.add_subcommand("destroy",
                                    "Remove every resource of the selected stacks") };
  destroy->add_option("stacks", destroy_cfg.stacks, "Stacks to destroy (all if omitted)");
  destroy->add_option("--stacks-dir",
                      destroy_cfg.stacks_dir,
                      "Stacks directory, relative to the workspace root");
  destroy->add_flag("--skip-refresh",
                    destroy_cfg.skip_refresh,
                    "Do not refresh provider state before previewing");
  destroy->add_flag("--skip-preview",
                    destroy_cfg.skip_preview,
                    "Destroy without computing or confirming a preview");
  destroy->add_flag("-y,--yes", destroy_cfg.yes, "Destroy without prompting");
  destroy->add_option("-j,--jobs", destroy_cfg.jobs, "Maximum stacks destroyed at once")
      ->check(CLI::NonNegativeNumber);
  destroy->callback([&cmd_cfg, &destroy_cfg] { cmd_cfg = destroy_cfg; });

  // Outputs subcommand
  cmd_outputs::cfg outputs_cfg{};
  auto *outputs{ app.add_subcommand("outputs", "Print the recorded state of stacks") };
  outputs->add_option("stacks", outputs_cfg.stacks, "Stacks to show (all if omitted)");
  outputs->add_option("--stacks-dir",
                      outputs_cfg.stacks_dir,
                      "Stacks directory, relative to the workspace root");
  outputs->callback([&cmd_cfg, &outputs_cfg] { cmd_cfg = outputs_cfg; });

  // Secrets subcommand group
  auto *secrets{ app.add_subcommand("secrets", "Manage profile keys and secret bundles") };
  secrets->require_subcommand(1);

  auto *secrets_init{ secrets->add_subcommand(
      "init",
      "Generate a key and profile config for --profile") };
  secrets_init->callback([&cmd_cfg] {
    cmd_secrets::cfg cfg{};
    cfg.act = cmd_secrets::action::init;
    cmd_cfg = cfg;
  });

  cmd_secrets::cfg encrypt_cfg{};
  encrypt_cfg.act = cmd_secrets::action::encrypt;
  auto *secrets_encrypt{ secrets->add_subcommand(
      "encrypt",
      "Seal a plaintext NAME=value file with the profile key") };
  secrets_encrypt->add_option("file", encrypt_cfg.input, "Plaintext secrets file")
      ->required()
      ->check(CLI::ExistingFile);
  secrets_encrypt->add_option("out", encrypt_cfg.output, "Sealed bundle to write")
      ->required();
  secrets_encrypt->callback([&cmd_cfg, &encrypt_cfg] { cmd_cfg = encrypt_cfg; });

  cmd_secrets::cfg list_cfg{};
  list_cfg.act = cmd_secrets::action::list;
  auto *secrets_list{ secrets->add_subcommand("list",
                                              "Print the names of decrypted secrets") };
  secrets_list->add_option("--stacks-dir",
                           list_cfg.stacks_dir,
                           "Stacks directory, relative to the workspace root");
  secrets_list->callback([&cmd_cfg, &list_cfg] { cmd_cfg = list_cfg; });

  cmd_secrets::cfg delete_cfg{};
  delete_cfg.act = cmd_secrets::action::remove;
  auto *secrets_delete{ secrets->add_subcommand("delete",
                                                "Remove one secret from a sealed bundle") };
  secrets_delete->add_option("bundle", delete_cfg.bundle, "Sealed bundle to edit")
      ->required()
      ->check(CLI::ExistingFile);
  secrets_delete->add_option("name", delete_cfg.name, "Secret to remove")->required();
  secrets_delete->callback([&cmd_cfg, &delete_cfg] { cmd_cfg = delete_cfg; });

  try {
    app.parse(argc, argv);
  } catch (CLI::CallForHelp const &) {
    args.cli_output = app.help();
  } catch (CLI::ParseError const &e) { args.cli_output = std::string(e.what()); }

  // --trace defaults to stderr if no value provided
  bool const trace_requested{ trace_option->count() > 0 };
  std::vector<std::string> trace_specs_tokens;

  if (trace_requested) {
    if (trace_spec.empty()) {
      trace_specs_tokens.push_back("stderr");
    } else {
      for (std::string_view sv{ trace_spec }; !sv.empty();) {
        auto const pos{ sv.find(',') };
        auto const token{ sv.substr(0, pos) };
        if (!token.empty()) { trace_specs_tokens.emplace_back(token); }
        sv = (pos == std::string_view::npos) ? std::string_view{} : sv.substr(pos + 1);
      }
    }
  }

  if (!trace_specs_tokens.empty()) {
    args.verbosity = tui::level::TUI_TRACE;
    args.decorated_logging = true;
    for (auto const &spec : trace_specs_tokens) {
      if (spec == "stderr") {
        args.trace_outputs.push_back({ tui::trace_output_type::std_err, std::nullopt });
      } else if (spec.rfind("file:", 0) == 0 && spec.size() > 5) {
        args.trace_outputs.push_back(
            { tui::trace_output_type::file, std::filesystem::path{ spec.substr(5) } });
      } else {
        args.cli_output = "Invalid trace output spec: " + spec;
        args.trace_outputs.clear();
        cmd_cfg.reset();
        break;
      }
    }
  } else if (verbose) {
    args.verbosity = tui::level::TUI_DEBUG;
    args.decorated_logging = true;
  } else {
    args.verbosity = tui::level::TUI_INFO;
    args.decorated_logging = false;
  }

  if ((version_flag_short || version_flag_long) && args.cli_output.empty()) {
    args.cmd_cfg = cmd_version::cfg{};
    return args;
  }

  if (cmd_cfg) {
    args.cmd_cfg = *cmd_cfg;
  } else if (args.cli_output.empty()) {
    args.cli_output = app.help();
  }

  return args;
}

}  // namespace strata
