#include <devloop/app.hpp>

int main(int argc, char** argv) {
  return devloop::App{}.run(argc, argv);
}
