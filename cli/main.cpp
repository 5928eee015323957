#include <cstdlib>
#include <exception>
#include <filesystem>
#include <iostream>
#include <system_error>

#include "application.hpp"
#include "commandline.hpp"
#include "localfilesystem.hpp"
#include "pathguard.hpp"

int main(int argc, char *argv[]) {
  auto parsed = CommandLine::parse(argc, argv);
  if (!parsed.ok) {
    std::cerr << "Error: " << parsed.error << "\n\n" << CommandLine::usage();
    return EXIT_FAILURE;
  }

  std::error_code ec;
  const std::filesystem::path workingDir = std::filesystem::current_path(ec);
  if (ec) {
    std::cerr << "Error: cannot determine the current directory: "
              << ec.message() << std::endl;
    return EXIT_FAILURE;
  }

  try {
    LocalFileSystem fs;
    PathGuard guard;
    Application app(fs, guard, std::cout, std::cerr);
    return app.run(parsed.options, workingDir);
  } catch (const std::exception &e) {
    std::cerr << "Error: " << e.what() << std::endl;
    return EXIT_FAILURE;
  }
}
