#ifndef WEAVEPACK_CLI_HPP
#define WEAVEPACK_CLI_HPP

#include <string>
#include <vector>
#include <map>
#include <ostream>

#include "../common/config.hpp"
#include "../items/tag.hpp"

/**
 * @brief One invocation of the command line tool.
 *
 * Usage: weavepack [--gateway <url>] [--log <file>] [--verbose] <command> [args]
 */
class CLI {
public:
    CLI(std::vector<std::string> args, std::ostream& out);

    // Returns the process exit status.
    int run();

private:
    struct Options {
        std::vector<std::string> positional;
        std::map<std::string, std::string> values;
        std::vector<Tag> tags;
        bool stream = false;
    };

    void print_help();
    Options parse_options(size_t first) const;
    static std::string require(const Options& options, const std::string& name);

    int cmd_keygen(const Options& options);
    int cmd_chunk(const Options& options);
    int cmd_item_create(const Options& options);
    int cmd_item_verify(const Options& options);
    int cmd_bundle(const Options& options);
    int cmd_bundle_verify(const Options& options);
    int cmd_tx_post(const Options& options);

    std::vector<std::string> args_;
    std::ostream& out_;
    GatewayConfig gateway_;
};

#endif // WEAVEPACK_CLI_HPP
