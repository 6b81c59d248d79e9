#include "logging.hpp"

#include <iostream>

void log_info(const std::string& msg) { std::cout << "[INFO] " << msg << std::endl; }

void log_warn(const std::string& msg) { std::cerr << "[WARN] " << msg << std::endl; }

void log_error(const std::string& msg) { std::cerr << "[ERROR] " << msg << std::endl; }
