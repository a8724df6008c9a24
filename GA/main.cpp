#include <chrono>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

#include "cli_args.hpp"
#include "fitness.hpp"
#include "frame_analysis.hpp"
#include "frame_ga.hpp"
#include "frame_problem.hpp"

using namespace std;

namespace
{
    void printUsage(const char *argv0)
    {
        cerr << "Usage: " << argv0 << " [pop_size] [generations] [seed] [threads] [history.csv]" << endl;
    }
}

int main(int argc, char **argv)
{
    cout << "=== Triangular Truss Frame GA ===" << endl;

    auto start_time = chrono::high_resolution_clock::now();

    try
    {
        FrameProblem problem = createSteelTriangleProblem();
        string history_file;

        if (argc - 1 > MAX_CLI_ARGS)
        {
            printUsage(argv[0]);
            return 2;
        }
        applyArguments(vector<string>(argv + 1, argv + argc), problem, history_file);

        FrameGA optimizer(problem);
        FitnessRecord best = optimizer.optimize();

        if (!history_file.empty())
        {
            optimizer.exportHistory(history_file);
        }

        auto end_time = chrono::high_resolution_clock::now();
        auto duration = chrono::duration_cast<chrono::milliseconds>(end_time - start_time);

        cout << "Optimal frame design: " << best.frame.toString() << endl;
        if (best.analysis_failed)
        {
            cerr << "No analyzable design was found" << endl;
            return 1;
        }

        // Re-analyze the winner so the report does not depend on GA bookkeeping
        FrameAnalysis analysis = analyzeFrame(best.frame, problem.material, problem.load);
        const Constraints &limits = problem.constraints;

        cout << "Mass = " << analysis.mass << " kg" << endl;
        cout << "Max stress = " << analysis.max_stress / 1e6 << " MPa (Yield stress = "
             << limits.yield_stress / 1e6 << " MPa)" << endl;
        cout << "Max deflection = " << analysis.max_deflection * 1000.0 << " mm (Limit = "
             << limits.deflection_limit * 1000.0 << " mm)" << endl;
        cout << "Fitness = " << best.fitness << " ("
             << (isFeasible(analysis.max_stress, analysis.max_deflection, limits) ? "FEASIBLE" : "INFEASIBLE")
             << ")" << endl;
        cout << "Completed in " << duration.count() << " ms" << endl;
    }
    catch (const exception &e)
    {
        cerr << "Error in frame optimization: " << e.what() << endl;
        return 1;
    }

    return 0;
}
