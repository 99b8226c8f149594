#pragma once

namespace devloop {

class App {
public:
  int run(int argc, char** argv);
};

} // namespace devloop
