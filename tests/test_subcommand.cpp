// Unit tests for the subcommand registry and top-level dispatch

#include "cli/subcommand.hpp"

#include <cassert>
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

using orfkit::cli::SubcommandRegistry;

class ArgvBuilder {
public:
    ArgvBuilder& add(const char* arg) {
        args_.push_back(strdup(arg));
        return *this;
    }

    int argc() const { return static_cast<int>(args_.size()); }
    char** argv() { return args_.data(); }

    ~ArgvBuilder() {
        for (char* arg : args_) {
            std::free(arg);
        }
    }

private:
    std::vector<char*> args_;
};

static std::vector<std::string> seen_args;

static int record_args(int argc, char* argv[]) {
    seen_args.assign(argv, argv + argc);
    return 7;
}

void test_registration_order() {
    std::cout << "Testing registration order... ";
    auto& registry = SubcommandRegistry::instance();
    registry.register_command("zeta", "Last", record_args, 90);
    registry.register_command("alpha", "First", record_args, 10);
    registry.register_command("beta", "Tied with alpha", record_args, 10);

    const auto& cmds = registry.commands();
    assert(cmds.size() == 3);
    assert(cmds[0].name == "alpha");
    assert(cmds[1].name == "beta");
    assert(cmds[2].name == "zeta");
    std::cout << "PASSED\n";
}

void test_reregistration() {
    std::cout << "Testing re-registration... ";
    auto& registry = SubcommandRegistry::instance();
    registry.register_command("zeta", "Now first", record_args, 1);
    const auto& cmds = registry.commands();
    assert(cmds.size() == 3);
    assert(cmds[0].name == "zeta");
    assert(cmds[0].description == "Now first");

    assert(registry.find("beta") != nullptr);
    assert(registry.find("beta")->description == "Tied with alpha");
    assert(registry.find("gamma") == nullptr);
    std::cout << "PASSED\n";
}

void test_help_text() {
    std::cout << "Testing help text... ";
    std::ostringstream oss;
    SubcommandRegistry::instance().print_help(oss, "orfkit");
    const std::string help = oss.str();
    assert(help.find("Usage: orfkit <command> [options]") != std::string::npos);
    assert(help.find("  zeta   Now first\n") != std::string::npos);
    assert(help.find("  alpha  First\n") != std::string::npos);
    assert(help.find("zeta") < help.find("alpha"));
    std::cout << "PASSED\n";
}

void test_dispatch() {
    std::cout << "Testing dispatch... ";
    auto& registry = SubcommandRegistry::instance();
    {
        ArgvBuilder builder;
        builder.add("orfkit").add("alpha").add("in.fa").add("-v");
        assert(registry.dispatch(builder.argc(), builder.argv()) == 7);
        assert((seen_args == std::vector<std::string>{"alpha", "in.fa", "-v"}));
    }
    {
        ArgvBuilder builder;
        builder.add("orfkit").add("nope");
        assert(registry.dispatch(builder.argc(), builder.argv()) == 1);
    }
    {
        ArgvBuilder builder;
        builder.add("orfkit");
        assert(registry.dispatch(builder.argc(), builder.argv()) == 1);
    }
    {
        ArgvBuilder builder;
        builder.add("orfkit").add("--help");
        assert(registry.dispatch(builder.argc(), builder.argv()) == 0);
    }
    {
        ArgvBuilder builder;
        builder.add("orfkit").add("-V");
        assert(registry.dispatch(builder.argc(), builder.argv()) == 0);
    }
    std::cout << "PASSED\n";
}

int main() {
    std::cout << "\n=== Subcommand Registry Tests ===\n\n";
    test_registration_order();
    test_reregistration();
    test_help_text();
    test_dispatch();
    std::cout << "\nAll tests passed!\n";
    return 0;
}
