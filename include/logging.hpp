#pragma once

#include <string>

void log_info(const std::string& msg);
void log_warn(const std::string& msg);
void log_error(const std::string& msg);
