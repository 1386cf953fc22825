#pragma once

#include <string>

#include "io/Config.hpp"

bool has_flag(int argc, char** argv, const std::string& key);
std::string get_arg(int argc, char** argv, const std::string& key, const std::string& def);

// throws std::runtime_error if the value is present but not a number
long long get_arg_int(int argc, char** argv, const std::string& key, long long def);
double get_arg_double(int argc, char** argv, const std::string& key, double def);

// --config file first, then path flags on top
RecommenderConfig resolve_config(int argc, char** argv);
