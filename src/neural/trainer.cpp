#include "neural/trainer.hpp"
#include <algorithm>
#include <cmath>
#include <sstream>
#include <stdexcept>

#ifdef HAS_OPENMP
#include <omp.h>
#endif

namespace glyphnet {

namespace {

constexpr double LOG_EPS = 1e-5;

struct Gradients {
    std::vector<std::vector<double>> weights;
    std::vector<std::vector<double>> biases;

    static Gradients zeros_like(const Model& model) {
        Gradients g;
        for (const auto& layer : model.layers()) {
            g.weights.emplace_back(layer.weights.size(), 0.0);
            g.biases.emplace_back(layer.biases.size(), 0.0);
        }
        return g;
    }
};

struct ExampleState {
    std::vector<double> input;
    std::vector<double> target;
    ForwardTrace trace;
    double loss = 0.0;
};

double clamp_grad(double g, double bound) {
    if (std::isnan(g)) return 0.0;
    return std::max(-bound, std::min(bound, g));
}

double example_loss(const std::vector<double>& p, const std::vector<double>& t, OutputActivation activation) {
    double loss = 0.0;
    for (size_t g = 0; g < p.size(); ++g) {
        if (activation == OutputActivation::Softmax) {
            loss -= t[g] * std::log(p[g] + LOG_EPS);
        } else {
            loss -= t[g] * std::log(p[g] + LOG_EPS) + (1.0 - t[g]) * std::log(1.0 - p[g] + LOG_EPS);
        }
    }
    return loss;
}

void backward(const Model& model, const ExampleState& ex, const std::vector<double>& class_weight,
              double clip, Gradients& out) {
    const auto& layers = model.layers();
    const std::vector<double>& p = ex.trace.output();

    std::vector<double> delta(p.size());
    for (size_t g = 0; g < p.size(); ++g) {
        delta[g] = (p[g] - ex.target[g]) * class_weight[g];
    }

    for (size_t li = layers.size(); li-- > 0;) {
        const Layer& layer = layers[li];
        const std::vector<double>& prev = li == 0 ? ex.input : ex.trace.post[li - 1];

        std::vector<double>& gw = out.weights[li];
        std::vector<double>& gb = out.biases[li];
        for (int r = 0; r < layer.rows; ++r) {
            double* row = gw.data() + static_cast<size_t>(r) * layer.cols;
            for (int c = 0; c < layer.cols; ++c) {
                row[c] = clamp_grad(delta[r] * prev[c], clip);
            }
            gb[r] = clamp_grad(delta[r], clip);
        }

        if (li == 0) break;

        const std::vector<double>& pre = ex.trace.pre[li - 1];
        std::vector<double> next(static_cast<size_t>(layer.cols), 0.0);
        for (int r = 0; r < layer.rows; ++r) {
            const double* row = layer.weights.data() + static_cast<size_t>(r) * layer.cols;
            for (int c = 0; c < layer.cols; ++c) {
                next[c] += row[c] * delta[r];
            }
        }
        for (int c = 0; c < layer.cols; ++c) {
            next[c] *= pre[c] > 0.0 ? 1.0 : model.alpha();
        }
        delta.swap(next);
    }
}

TrainOutcome make_outcome(TrainStatus status, const std::string& message, int batches, double loss,
                          std::shared_ptr<const Model> model) {
    TrainOutcome out;
    out.status = status;
    out.message = message;
    out.batches_completed = batches;
    out.last_loss = loss;
    out.model = std::move(model);
    return out;
}

}  // namespace

const char* phase_name(TrainPhase phase) {
    switch (phase) {
        case TrainPhase::Forward: return "forward";
        case TrainPhase::ClassWeights: return "class-weights";
        case TrainPhase::Backward: return "backward";
        case TrainPhase::Update: return "update";
    }
    return "unknown";
}

OptimizerState OptimizerState::for_model(const Model& model) {
    OptimizerState s;
    for (const auto& layer : model.layers()) {
        s.m_weights.emplace_back(layer.weights.size(), 0.0);
        s.v_weights.emplace_back(layer.weights.size(), 0.0);
        s.m_biases.emplace_back(layer.biases.size(), 0.0);
        s.v_biases.emplace_back(layer.biases.size(), 0.0);
    }
    return s;
}

bool OptimizerState::matches(const Model& model) const {
    const auto& layers = model.layers();
    if (m_weights.size() != layers.size() || v_weights.size() != layers.size() ||
        m_biases.size() != layers.size() || v_biases.size() != layers.size()) {
        return false;
    }
    for (size_t l = 0; l < layers.size(); ++l) {
        if (m_weights[l].size() != layers[l].weights.size() || v_weights[l].size() != layers[l].weights.size() ||
            m_biases[l].size() != layers[l].biases.size() || v_biases[l].size() != layers[l].biases.size()) {
            return false;
        }
    }
    return true;
}

bool Trainer::Config::validate(std::string& error) const {
    if (batch_size < 1) {
        error = "batch size must be positive";
        return false;
    }
    if (max_batches < 0) {
        error = "max batches must not be negative";
        return false;
    }
    if (parallelism < 1) {
        error = "parallelism must be at least 1";
        return false;
    }
    if (!(learning_rate > 0.0)) {
        error = "learning rate must be positive";
        return false;
    }
    if (learning_rate_decay < 0.0 || lambda < 0.0) {
        error = "learning rate decay and lambda must not be negative";
        return false;
    }
    if (beta1 < 0.0 || beta1 >= 1.0 || beta2 < 0.0 || beta2 >= 1.0) {
        error = "adam betas must be in [0, 1)";
        return false;
    }
    if (!(epsilon > 0.0) || !(gradient_clip > 0.0) || !(target_falloff > 0.0)) {
        error = "epsilon, gradient clip and target falloff must be positive";
        return false;
    }
    if (coerce_to_zero < 0.0 || coerce_to_zero >= 1.0) {
        error = "coerce-to-zero threshold must be in [0, 1)";
        return false;
    }
    return true;
}

Trainer::Trainer(std::shared_ptr<const Model> model, const Config& config) : config_(config), model_(std::move(model)) {
    if (!model_) {
        throw std::invalid_argument("Trainer: model must not be null");
    }
    optimizer_ = OptimizerState::for_model(*model_);
}

std::shared_ptr<const Model> Trainer::model() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return model_;
}

OptimizerState Trainer::optimizer() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return optimizer_;
}

std::vector<double> Trainer::target_distribution(const std::vector<double>& scores, double falloff,
                                                 double coerce_to_zero) {
    std::vector<double> t(scores.size(), 0.0);
    if (scores.empty()) return t;

    size_t best = 0;
    for (size_t g = 1; g < scores.size(); ++g) {
        if (scores[g] > scores[best] || std::isnan(scores[best])) best = g;
    }
    const double peak = scores[best];
    const double denom = 2.0 * falloff * falloff;

    double sum = 0.0;
    for (size_t g = 0; g < scores.size(); ++g) {
        if (std::isnan(scores[g])) continue;
        double d = peak - scores[g];
        double v = std::exp(-(d * d) / denom);
        if (v < coerce_to_zero) v = 0.0;
        t[g] = v;
        sum += v;
    }

    if (!(sum > 0.0)) {
        std::fill(t.begin(), t.end(), 0.0);
        t[best] = 1.0;
        return t;
    }
    for (double& v : t) v /= sum;
    return t;
}

std::vector<double> Trainer::class_weights(const std::vector<std::vector<double>>& targets, double center,
                                           double steepness) {
    if (targets.empty()) return {};
    const size_t glyphs = targets.front().size();
    if (glyphs == 0) return {};

    std::vector<double> mass(glyphs, 0.0);
    for (const auto& t : targets) {
        for (size_t g = 0; g < glyphs && g < t.size(); ++g) mass[g] += t[g];
    }

    double mean = 0.0;
    for (double m : mass) mean += m;
    mean /= static_cast<double>(glyphs);
    double var = 0.0;
    for (double m : mass) var += (m - mean) * (m - mean);
    const double sd = std::sqrt(var / static_cast<double>(glyphs));

    std::vector<double> z(glyphs, 0.0);
    if (sd > 1e-12) {
        for (size_t g = 0; g < glyphs; ++g) z[g] = (mass[g] - mean) / sd;
    }
    const auto [lo, hi] = std::minmax_element(z.begin(), z.end());
    const double zmin = *lo;
    const double range = *hi - *lo;

    std::vector<double> w(glyphs);
    for (size_t g = 0; g < glyphs; ++g) {
        double u = range > 1e-12 ? (z[g] - zmin) / range : 0.5;
        w[g] = 1.0 / (1.0 + std::exp(steepness * (u - center)));
    }
    return w;
}

Trainer::StepResult Trainer::run_step(const std::vector<TrainingExample>& batch, const CancellationToken& cancel,
                                      const Callbacks& callbacks, int batch_index) {
    StepResult result;
    auto fail = [&result](const std::string& msg) {
        result.status = TrainStatus::Failed;
        result.message = msg;
        return result;
    };
    auto cancelled = [&result](TrainPhase phase) {
        result.status = TrainStatus::Cancelled;
        result.message = std::string("cancelled before ") + phase_name(phase);
        return result;
    };
    auto enter = [&](TrainPhase phase) {
        if (callbacks.on_phase) callbacks.on_phase(phase, batch_index);
        return !cancel.requested();
    };

    std::string error;
    if (!config_.validate(error)) return fail(error);
    if (batch.empty()) return fail("empty batch");

    std::shared_ptr<const Model> snapshot;
    OptimizerState state;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        snapshot = model_;
        state = optimizer_;
    }
    const Model& model = *snapshot;
    if (model.glyphs().empty()) return fail("glyph codebook is empty");
    if (!model.validate(0, error)) return fail("invalid model: " + error);
    if (!state.matches(model)) return fail("optimizer state does not match model shape");

    const size_t glyph_count = model.glyphs().size();
    const size_t feature_count = static_cast<size_t>(model.feature_count());
    for (size_t i = 0; i < batch.size(); ++i) {
        if (batch[i].intensities.size() != feature_count) {
            return fail("example " + std::to_string(i) + " has " + std::to_string(batch[i].intensities.size()) +
                        " intensities, model expects " + std::to_string(feature_count));
        }
        if (batch[i].scores.size() != glyph_count) {
            return fail("example " + std::to_string(i) + " has " + std::to_string(batch[i].scores.size()) +
                        " scores, codebook has " + std::to_string(glyph_count));
        }
    }

    const int n = static_cast<int>(batch.size());
    std::vector<ExampleState> examples(batch.size());

    if (!enter(TrainPhase::Forward)) return cancelled(TrainPhase::Forward);
#ifdef HAS_OPENMP
    #pragma omp parallel for num_threads(config_.parallelism) schedule(dynamic)
#endif
    for (int i = 0; i < n; ++i) {
        if (cancel.requested()) continue;
        ExampleState& ex = examples[i];
        ex.input = standardize(batch[i].intensities);
        ex.target = target_distribution(batch[i].scores, config_.target_falloff, config_.coerce_to_zero);
        ex.trace = model.forward(ex.input, config_.activation);
        ex.loss = example_loss(ex.trace.output(), ex.target, config_.activation);
    }

    if (!enter(TrainPhase::ClassWeights)) return cancelled(TrainPhase::ClassWeights);
    std::vector<double> weights(glyph_count, 1.0);
    if (config_.class_weighting) {
        std::vector<std::vector<double>> targets;
        targets.reserve(examples.size());
        for (const auto& ex : examples) targets.push_back(ex.target);
        weights = class_weights(targets, config_.class_weight_center, config_.class_weight_steepness);
    }

    if (!enter(TrainPhase::Backward)) return cancelled(TrainPhase::Backward);
    std::vector<Gradients> grads(batch.size());
#ifdef HAS_OPENMP
    #pragma omp parallel for num_threads(config_.parallelism) schedule(dynamic)
#endif
    for (int i = 0; i < n; ++i) {
        if (cancel.requested()) continue;
        grads[i] = Gradients::zeros_like(model);
        backward(model, examples[i], weights, config_.gradient_clip, grads[i]);
    }

    if (!enter(TrainPhase::Update)) return cancelled(TrainPhase::Update);

    // Averaged in example order so the result does not depend on scheduling.
    Gradients avg = Gradients::zeros_like(model);
    double loss = 0.0;
    for (int i = 0; i < n; ++i) {
        loss += examples[i].loss;
        for (size_t l = 0; l < avg.weights.size(); ++l) {
            for (size_t k = 0; k < avg.weights[l].size(); ++k) avg.weights[l][k] += grads[i].weights[l][k];
            for (size_t k = 0; k < avg.biases[l].size(); ++k) avg.biases[l][k] += grads[i].biases[l][k];
        }
    }
    const double inv_n = 1.0 / static_cast<double>(n);
    loss *= inv_n;

    Model next = model;
    const double t = static_cast<double>(state.step);
    const double lr = config_.learning_rate * std::exp(-config_.learning_rate_decay * t);
    const double correction1 = 1.0 - std::pow(config_.beta1, t + 1.0);
    const double correction2 = 1.0 - std::pow(config_.beta2, t + 1.0);
    const double clip = config_.gradient_clip;

    auto adam = [&](double& param, double& m, double& v, double g, double decay) {
        m = config_.beta1 * m + (1.0 - config_.beta1) * g;
        v = config_.beta2 * v + (1.0 - config_.beta2) * g * g;
        double m_hat = m / correction1;
        double v_hat = v / correction2;
        double step = m_hat / (std::sqrt(v_hat) + config_.epsilon) + decay * param;
        param -= lr * clamp_grad(step, clip);
    };

    for (size_t l = 0; l < next.layers().size(); ++l) {
        Layer& layer = next.layers()[l];
        for (size_t k = 0; k < layer.weights.size(); ++k) {
            adam(layer.weights[k], state.m_weights[l][k], state.v_weights[l][k], avg.weights[l][k] * inv_n,
                 config_.lambda);
        }
        for (size_t k = 0; k < layer.biases.size(); ++k) {
            adam(layer.biases[k], state.m_biases[l][k], state.v_biases[l][k], avg.biases[l][k] * inv_n, 0.0);
        }
    }
    state.step++;

    if (cancel.requested()) return cancelled(TrainPhase::Update);

    {
        std::lock_guard<std::mutex> lock(mutex_);
        model_ = std::make_shared<const Model>(std::move(next));
        optimizer_ = std::move(state);
    }
    result.loss = loss;
    return result;
}

TrainOutcome Trainer::train_batch(const std::vector<TrainingExample>& batch, const CancellationToken& cancel,
                                  const Callbacks& callbacks) {
    if (cancel.requested()) {
        return make_outcome(TrainStatus::Cancelled, "cancelled before batch", 0, 0.0, model());
    }
    StepResult step = run_step(batch, cancel, callbacks, 0);
    if (step.status != TrainStatus::Completed) {
        return make_outcome(step.status, step.message, 0, 0.0, model());
    }
    auto current = model();
    if (callbacks.on_checkpoint) callbacks.on_checkpoint(current, 1, step.loss);
    return make_outcome(TrainStatus::Completed, "", 1, step.loss, current);
}

TrainOutcome Trainer::train(ExampleSource& source, const CancellationToken& cancel, const Callbacks& callbacks) {
    std::string error;
    if (!config_.validate(error)) {
        return make_outcome(TrainStatus::Failed, error, 0, 0.0, model());
    }

    int completed = 0;
    double last_loss = 0.0;
    std::vector<TrainingExample> batch;
    batch.reserve(static_cast<size_t>(config_.batch_size));

    while (config_.max_batches == 0 || completed < config_.max_batches) {
        if (cancel.requested()) {
            return make_outcome(TrainStatus::Cancelled, "cancelled at batch boundary", completed, last_loss, model());
        }

        batch.clear();
        TrainingExample ex;
        while (batch.size() < static_cast<size_t>(config_.batch_size) && source.next(ex)) {
            batch.push_back(std::move(ex));
            ex = TrainingExample{};
        }
        if (batch.empty()) {
            if (completed == 0) {
                return make_outcome(TrainStatus::Failed, "training source produced no examples", 0, 0.0, model());
            }
            break;
        }

        StepResult step = run_step(batch, cancel, callbacks, completed);
        if (step.status != TrainStatus::Completed) {
            return make_outcome(step.status, step.message, completed, last_loss, model());
        }
        completed++;
        last_loss = step.loss;

        if (callbacks.log) {
            std::ostringstream ss;
            ss << "[train] batch " << completed << " size " << batch.size() << " loss " << step.loss;
            callbacks.log(ss.str());
        }
        if (callbacks.on_checkpoint) {
            callbacks.on_checkpoint(model(), completed, step.loss);
        }

        if (batch.size() < static_cast<size_t>(config_.batch_size)) break;
    }

    return make_outcome(TrainStatus::Completed, "", completed, last_loss, model());
}

}
