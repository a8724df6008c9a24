#ifndef CLI_ARGS_HPP
#define CLI_ARGS_HPP

#include <string>
#include <vector>

#include "frame_problem.hpp"

// Positional driver arguments: [pop_size] [generations] [seed] [threads] [history.csv]
const int MAX_CLI_ARGS = 5;

// Overrides the matching fields of problem and history_file.
// Throws std::invalid_argument (or std::out_of_range) on a malformed value.
void applyArguments(const std::vector<std::string> &args, FrameProblem &problem, std::string &history_file);

#endif // CLI_ARGS_HPP
