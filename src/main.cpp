#include <faceid/app/app.hpp>

#include <utility>

int main(int argc, char** argv) {
  auto config = faceid::ParseArguments(argc, argv);

  faceid::App app(argc, argv, std::move(config));
  return faceid::ToExitCode(app.Run());
}
