#include <scalargrad/scalargrad.h>
#include "test_common.h"
#include <cmath>
#include <filesystem>
#include <fstream>
#include <iostream>

using namespace scalargrad;
using namespace scalargrad_test;

namespace {

std::string write_temp(const std::string& name, const std::string& contents) {
    const auto path = std::filesystem::temp_directory_path() / name;
    std::ofstream file(path);
    file << contents;
    return path.string();
}

}  // namespace

int main() {
    std::cout << "1. read_csv_file:" << std::endl;
    {
        const auto path = write_temp("scalargrad_moons_ok.csv", "x,y,label\r\n0.5,1.5,1\r\n\n-0.25, 0.75 ,-1\n");
        auto points = read_csv_file(path);
        expect_true(points.size() == 2, "header and blank line skipped");
        expect_near(points[0].x, 0.5, "x0");
        expect_near(points[0].y, 1.5, "y0");
        expect_near(points[0].label, 1.0, "label0");
        expect_near(points[1].y, 0.75, "y1 with surrounding spaces");
        expect_near(points[1].label, -1.0, "label1");

        Dataset data = load_moons_data(path);
        expect_true(data.size() == 2 && data.xs.size() == 2, "dataset size");
        expect_true(data.xs[1].size() == 2, "two features");
        expect_near(data.xs[1][0], -0.25, "feature copied");
        std::filesystem::remove(path);
    }
    {
        const auto path = write_temp("scalargrad_moons_bad.csv", "x,y,label\n1.0,abc,1\n");
        expect_throws<std::runtime_error>([&] { read_csv_file(path); }, "non-numeric field throws");
        std::filesystem::remove(path);
    }
    {
        const auto path = write_temp("scalargrad_moons_short.csv", "x,y,label\n1.0,2.0\n");
        expect_throws<std::runtime_error>([&] { read_csv_file(path); }, "missing field throws");
        std::filesystem::remove(path);
    }
    expect_throws<std::runtime_error>([] { read_csv_file("/nonexistent/scalargrad.csv"); }, "missing file throws");

    std::cout << "2. make_moons:" << std::endl;
    {
        Dataset data = make_moons(100, 0.0);
        expect_true(data.size() == 100, "100 samples");
        int negatives = 0;
        for (double y : data.ys) {
            negatives += y < 0.0 ? 1 : 0;
        }
        expect_true(negatives == 50, "half of them in each moon");
        expect_near(data.xs[0][0], 1.0, "outer moon starts at (1, 0)", 1e-12);
        expect_near(data.xs[0][1], 0.0, "outer moon starts at (1, 0)", 1e-12);
        expect_near(data.xs[50][0], 0.0, "inner moon starts at (0, 0.5)", 1e-12);
        expect_near(data.xs[50][1], 0.5, "inner moon starts at (0, 0.5)", 1e-12);
        expect_near(std::hypot(data.xs[10][0], data.xs[10][1]), 1.0, "outer points on the unit circle", 1e-12);

        Dataset noisy = make_moons(7, 0.1);
        expect_true(noisy.size() == 7 && noisy.xs.size() == 7, "odd sample counts");
    }

    std::cout << "3. uniform:" << std::endl;
    {
        bool in_range = true;
        for (int i = 0; i < 1000; ++i) {
            const double u = uniform(-1.0, 1.0);
            in_range = in_range && u >= -1.0 && u < 1.0;
        }
        expect_true(in_range, "samples in [-1, 1)");
    }

    return finish("test_utils");
}
