/**
 * Train a 2-16-16-1 MLP on the two-moons dataset with a max-margin loss,
 * then print an ASCII view of the learned decision boundary.
 *
 * Usage: train_moons [make_moons.csv]
 * The CSV has a header row and "x,y,label" rows with labels in {-1, 1}.
 * Without an argument, 100 noisy samples are generated in process.
 */

#include <scalargrad/scalargrad.h>
#include <iostream>
#include <iomanip>

using namespace scalargrad;

int main(int argc, char* argv[]) {
    // 1. Load dataset
    Dataset data;
    try {
        if (argc > 1) {
            std::cout << "Loading " << argv[1] << "..." << std::endl;
            data = load_moons_data(argv[1]);
        } else {
            std::cout << "Generating moons dataset..." << std::endl;
            data = make_moons(100, 0.1);
        }
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
    if (data.size() == 0) {
        std::cerr << "Error: dataset is empty" << std::endl;
        return 1;
    }
    std::cout << "num samples: " << data.size() << std::endl;

    // 2. Configure and initialize model
    Config config{
        .hidden = {16, 16},
        .num_steps = 100,
        .learning_rate = 1.0,
        .alpha = 1e-4
    };

    std::vector<int> nouts = config.hidden;
    nouts.push_back(1);
    MLP model(2, nouts);
    std::cout << model.describe() << std::endl;
    std::cout << "num params: " << model.parameters().size() << std::endl;

    // 3. Train
    SGD optimizer(config.learning_rate, 0.1);
    std::cout << "\nTraining..." << std::endl;

    for (int k = 0; k < config.num_steps; ++k) {
        LossResult result = train_step(model, data, optimizer, k, config.num_steps, config.alpha);
        std::cout << "step " << k << " loss " << std::fixed << std::setprecision(3) << result.total->data
                  << ", accuracy " << std::setprecision(2) << result.accuracy * 100.0 << "%" << std::endl;
    }

    // 4. Decision boundary
    std::cout << "\n" << decision_boundary(model, 20);

    return 0;
}
