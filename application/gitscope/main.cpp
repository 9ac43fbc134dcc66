#include <gitscope/app.hpp>

#include <spdlog/spdlog.h>

#include <exception>

int main(int argc, char **argv) {
  try {
    return gitscope::App{}.run(argc, argv);
  } catch (const std::exception &e) {
    spdlog::critical("gitscope: {}", e.what());
    return 1;
  }
}
