#pragma once

#include <string>
#include <vector>
#include <map>
#include <functional>
#include <iosfwd>
#include <filesystem>
#include <core/abort_token.hpp>
#include <managers/launcher.hpp>

// Command-line front end. Each command returns the process exit code.
class ExpctlCLI {
public:
    ExpctlCLI(AbortToken& abort, std::istream& in, std::ostream& out);

    using CommandHandler = std::function<int(ExpctlCLI&, const std::vector<std::string>&)>;

    int execute(const std::string& command, const std::vector<std::string>& args);
    bool has_command(const std::string& command) const { return commands_.count(command) > 0; }
    void print_help() const;

    int run_session(const std::vector<std::string>& args);
    int run_resume(const std::vector<std::string>& args);
    int run_status(const std::vector<std::string>& args);
    int run_check(const std::vector<std::string>& args);
    int run_setup(const std::vector<std::string>& args);

    // Tests replace the host collaborators; production builds them from config.
    using CollaboratorFactory = std::function<Collaborators(const Config&)>;
    void set_collaborator_factory(CollaboratorFactory factory) { factory_ = std::move(factory); }

private:
    struct Options {
        std::filesystem::path config_file;
        bool headless = false;
        bool debug = false;
        std::vector<std::string> positional;
        std::string error;
    };

    void add_command(const std::string& name, CommandHandler handler,
                     const std::string& usage, const std::string& help);
    Options parse_options(const std::vector<std::string>& args) const;
    Result<Config> load_config(const Options& opts) const;
    Launcher make_launcher(const Config& config);
    void print_result(const SessionResult& result) const;
    void print_ledger(const Ledger& ledger) const;

    struct CommandEntry {
        CommandHandler handler;
        std::string usage;
        std::string help;
    };

    AbortToken& abort_;
    std::istream& in_;
    std::ostream& out_;
    CollaboratorFactory factory_;
    std::map<std::string, CommandEntry> commands_;
};
