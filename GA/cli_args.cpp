#include "cli_args.hpp"

#include <stdexcept>

using namespace std;

namespace
{
    int parseInt(const string &text, const string &name)
    {
        size_t used = 0;
        int value = stoi(text, &used);
        if (used != text.size())
        {
            throw invalid_argument(name + " is not an integer: " + text);
        }
        return value;
    }

    long parseLong(const string &text, const string &name)
    {
        size_t used = 0;
        long value = stol(text, &used);
        if (used != text.size())
        {
            throw invalid_argument(name + " is not an integer: " + text);
        }
        return value;
    }
}

void applyArguments(const vector<string> &args, FrameProblem &problem, string &history_file)
{
    if (args.size() > static_cast<size_t>(MAX_CLI_ARGS))
    {
        throw invalid_argument("too many arguments: " + to_string(args.size()));
    }

    if (args.size() > 0)
        problem.ga.pop_size = parseInt(args[0], "pop_size");
    if (args.size() > 1)
        problem.ga.generations = parseInt(args[1], "generations");
    if (args.size() > 2)
        problem.ga.seed = parseLong(args[2], "seed");
    if (args.size() > 3)
        problem.ga.n_threads = parseInt(args[3], "threads");
    if (args.size() > 4)
        history_file = args[4];
}
