#include <iostream>
#include <string>
#include <vector>

#include "cli/cli.hpp"
#include "common/errors.hpp"
#include "common/logger.hpp"

int main(int argc, char* argv[]) {
    std::vector<std::string> args(argv + 1, argv + argc);

    try {
        CLI cli(args, std::cout);
        return cli.run();
    } catch (const InvalidSignature& e) {
        LOG_ERR(e.what());
        std::cerr << e.what() << std::endl;
        return 1;
    } catch (const ValidationError& e) {
        LOG_ERR(e.what());
        std::cerr << e.what() << std::endl;
        return 1;
    } catch (const std::exception& e) {
        LOG_ERR("Fatal: ", e.what());
        std::cerr << "Exception: " << e.what() << "\n";
        return 3;
    }
}
