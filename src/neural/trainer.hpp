#pragma once

#include "core/cancellation.hpp"
#include "neural/example_source.hpp"
#include "neural/model.hpp"
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace glyphnet {

// Adam moments shaped like the model's layers.
struct OptimizerState {
    std::vector<std::vector<double>> m_weights;
    std::vector<std::vector<double>> v_weights;
    std::vector<std::vector<double>> m_biases;
    std::vector<std::vector<double>> v_biases;
    int64_t step = 0;

    static OptimizerState for_model(const Model& model);
    bool matches(const Model& model) const;
};

enum class TrainStatus {
    Completed,
    Cancelled,
    Failed
};

enum class TrainPhase {
    Forward,
    ClassWeights,
    Backward,
    Update
};

const char* phase_name(TrainPhase phase);

struct TrainOutcome {
    TrainStatus status = TrainStatus::Completed;
    std::string message;
    int batches_completed = 0;
    double last_loss = 0.0;
    std::shared_ptr<const Model> model;

    bool completed() const { return status == TrainStatus::Completed; }
    bool cancelled() const { return status == TrainStatus::Cancelled; }
    bool failed() const { return status == TrainStatus::Failed; }
};

class Trainer {
public:
    struct Config {
        int batch_size = 64;
        int max_batches = 0;  // 0 trains until the source is exhausted
        int parallelism = 8;
        double learning_rate = 0.01;
        double learning_rate_decay = 0.0;
        double lambda = 1e-4;
        double beta1 = 0.9;
        double beta2 = 0.999;
        double epsilon = 1e-7;
        double gradient_clip = 5.0;
        double target_falloff = 0.03;
        double coerce_to_zero = 1e-4;
        bool class_weighting = true;
        double class_weight_center = 0.5;
        double class_weight_steepness = 4.0;
        OutputActivation activation = OutputActivation::Softmax;

        bool validate(std::string& error) const;
    };

    struct Callbacks {
        // Runs after a batch is committed; never interrupted by cancellation.
        std::function<void(const std::shared_ptr<const Model>&, int batch, double loss)> on_checkpoint;
        std::function<void(TrainPhase, int batch)> on_phase;
        std::function<void(const std::string&)> log;
    };

    // Starts from a fresh optimizer state for the given model.
    Trainer(std::shared_ptr<const Model> model, const Config& config);

    TrainOutcome train(ExampleSource& source, const CancellationToken& cancel,
                       const Callbacks& callbacks = Callbacks{});
    TrainOutcome train_batch(const std::vector<TrainingExample>& batch, const CancellationToken& cancel,
                             const Callbacks& callbacks = Callbacks{});

    std::shared_ptr<const Model> model() const;
    OptimizerState optimizer() const;
    const Config& config() const { return config_; }

    // Gaussian falloff against the best score, small values cut to zero,
    // renormalized to sum to 1.
    static std::vector<double> target_distribution(const std::vector<double>& scores, double falloff,
                                                   double coerce_to_zero);
    // Per-glyph weights, lower for glyphs carrying more of the batch's target mass.
    static std::vector<double> class_weights(const std::vector<std::vector<double>>& targets, double center,
                                             double steepness);

private:
    struct StepResult {
        TrainStatus status = TrainStatus::Completed;
        std::string message;
        double loss = 0.0;
    };

    StepResult run_step(const std::vector<TrainingExample>& batch, const CancellationToken& cancel,
                        const Callbacks& callbacks, int batch_index);

    Config config_;
    mutable std::mutex mutex_;
    std::shared_ptr<const Model> model_;
    OptimizerState optimizer_;
};

}
