/**
 * @file main.cpp
 * @brief Entry point for sqlbackup
 */

#include <iostream>

#include "app/application.h"

/**
 * @brief Main entry point
 * @param argc Argument count
 * @param argv Argument values
 * @return Exit code (0 = success, 1 = error)
 */
int main(int argc, char* argv[]) {
  auto app = sqlbackup::app::Application::Create(argc, argv);
  if (!app) {
    std::cerr << "Error: " << app.error().message() << "\n";
    return 1;
  }

  return (*app)->Run();
}
