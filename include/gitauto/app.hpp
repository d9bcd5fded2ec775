#pragma once

namespace gitauto {

class App {
public:
  int run(int argc, char **argv);
};

} // namespace gitauto
