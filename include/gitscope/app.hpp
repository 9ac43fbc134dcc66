#pragma once

namespace gitscope {

struct App {
  int run(int argc, char **argv);
};

} // namespace gitscope
