// TSAM - test_table_io.cpp

#include <cmath>
#include <cstdio>
#include <fstream>
#include <iostream>
#include <string>
#include "io/table_io.h"
#include "util/errors.h"

namespace {

void write_file(const std::string& path, const std::string& text) {
    std::ofstream out(path);
    out << text;
}

template <typename F>
bool raises_config_error(F f, const std::string& expect_in_message = "") {
    try {
        f();
    } catch (const tsam::ConfigError& e) {
        return std::string(e.what()).find(expect_in_message) != std::string::npos;
    }
    return false;
}

}  // namespace

int main() {
    using namespace tsam;

    // CSV with quoted header, row names and an extra column
    {
        const std::string path = "tsam_io_obs.csv";
        write_file(path,
                   "\"\",\"sample\",\"height\",\"range\",\"age\",\"ageUnc\",\"type\"\n"
                   "\"1\",\"BS-1\",0,20,820,5,\"normal\"\n"
                   "\n"
                   "\"2\",\"BS-2\",500,10,750.5,4,\"uniform\"\n");
        const auto obs = read_observations(path);
        std::remove(path.c_str());

        if (obs.size() != 2) {
            std::cerr << "expected 2 observations, got " << obs.size() << "\n";
            return 1;
        }
        if (obs[1].height != 500.0 || obs[1].height_uncertainty != 10.0 || obs[1].age != 750.5 ||
            obs[1].age_uncertainty != 4.0 || obs[1].height_shape != UncertaintyShape::Uniform ||
            obs[0].height_shape != UncertaintyShape::Gaussian) {
            std::cerr << "observation fields parsed wrong\n";
            return 1;
        }
    }

    // Tab separated, columns in another order
    {
        const std::string path = "tsam_io_obs.tsv";
        write_file(path,
                   "type\tage\tageUnc\theight\trange\n"
                   "normal\t700\t3\t1000\t15\n"
                   "normal\t650\t3\t1500\t15\n");
        const auto obs = read_observations(path);
        std::remove(path.c_str());
        if (obs.size() != 2 || obs[0].height != 1000.0 || obs[1].age != 650.0) {
            std::cerr << "TSV observations parsed wrong\n";
            return 1;
        }
    }

    // Malformed input names the file and line
    {
        const std::string path = "tsam_io_bad.csv";
        write_file(path, "height,range,age,ageUnc,type\n0,1,800,1,normal\n100,1,abc,1,normal\n");
        const bool ok = raises_config_error([&] { read_observations(path); }, path + ":3");
        std::remove(path.c_str());
        if (!ok) {
            std::cerr << "unparsable age should raise ConfigError naming line 3\n";
            return 1;
        }

        const std::string missing = "tsam_io_missing.csv";
        write_file(missing, "height,range,age,type\n0,1,800,normal\n");
        const bool ok2 = raises_config_error([&] { read_observations(missing); }, "ageUnc");
        std::remove(missing.c_str());
        if (!ok2) {
            std::cerr << "missing column should raise ConfigError\n";
            return 1;
        }

        if (!raises_config_error([] { read_observations("tsam_io_does_not_exist.csv"); })) {
            std::cerr << "missing file should raise ConfigError\n";
            return 1;
        }
    }

    // Posterior written by calibrate reads back
    {
        const std::string path = "tsam_io_posterior.csv";
        CompositePosterior post(2);
        post[0].a = 816.123456789;
        post[0].b = 1.2875;
        post[0].sigma = 3.5;
        post[1].a = 815.5;
        post[1].b = 1.31;
        post[1].sigma = 9.99;
        write_posterior(path, post);
        const auto back = read_posterior(path);
        std::remove(path.c_str());
        if (back.size() != 2 || std::abs(back[0].a - post[0].a) > 1e-6 || back[1].sigma != 9.99) {
            std::cerr << "posterior did not survive a write/read\n";
            return 1;
        }
    }

    // Heights: bare list or a height column
    {
        const std::string bare = "tsam_io_heights.txt";
        write_file(bare, "0\n250.5\n\n1000\n");
        const auto h1 = read_heights(bare);
        std::remove(bare.c_str());
        if (h1.size() != 3 || h1[1] != 250.5) {
            std::cerr << "bare height list parsed wrong\n";
            return 1;
        }

        const std::string table = "tsam_io_heights.csv";
        write_file(table, "sample,height\nA,10\nB,20\n");
        const auto h2 = read_heights(table);
        std::remove(table.c_str());
        if (h2.size() != 2 || h2[0] != 10.0 || h2[1] != 20.0) {
            std::cerr << "height column parsed wrong\n";
            return 1;
        }
    }

    // Age model header
    {
        const std::string path = "tsam_io_age_model.csv";
        AgeSummary s;
        s.height = 5.0;
        s.median = 800.0;
        s.lower = 795.0;
        s.upper = 805.0;
        write_age_model(path, {s});
        std::ifstream in(path);
        std::string header, row;
        std::getline(in, header);
        std::getline(in, row);
        in.close();
        std::remove(path.c_str());
        if (header != "height,age_median,age_min,age_max" || row != "5,800,795,805") {
            std::cerr << "age model output wrong: '" << header << "' / '" << row << "'\n";
            return 1;
        }
    }

    return 0;
}
