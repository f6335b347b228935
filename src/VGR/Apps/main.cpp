#include <exception>

#include <spdlog/spdlog.h>

#include "Apps/VinylGroove/App.hpp"

int main(int argc, char * argv[]) {
    try {
        return VGR::Apps::VinylGroove::RunApp(argc, argv);
    } catch (std::exception const & ex) {
        spdlog::critical("VinylGroove terminated with an unexpected error: {}", ex.what());
        return 1;
    }
}
