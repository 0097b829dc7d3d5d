// Model Tests

#include <seqnet/model.hpp>
#include <iostream>
#include <cmath>

using namespace seqnet;
using namespace seqnet::nn;

bool float_eq(float a, float b, float eps = 1e-5f) {
    return std::abs(a - b) < eps;
}

std::vector<std::unique_ptr<Layer>> mlp_layers(uint32_t seed = 1) {
    Generator gen(seed);
    std::vector<std::unique_ptr<Layer>> layers;
    layers.push_back(std::make_unique<Linear>(4, 6, gen));
    layers.push_back(std::make_unique<ReLU>(6));
    layers.push_back(std::make_unique<Dropout>(6, 0.5f, gen.fork()));
    layers.push_back(std::make_unique<Linear>(6, 3, gen));
    return layers;
}

template<typename F>
bool throws_value_error(F&& f) {
    try {
        f();
    } catch (const ValueError&) {
        return true;
    }
    return false;
}

// Test 1: Construction validation
bool test_model_construction() {
    if (!throws_value_error([] { Model m(std::vector<std::unique_ptr<Layer>>{}); })) {
        std::cerr << "model_construction: empty layers should throw ValueError" << std::endl;
        return false;
    }

    bool threw = false;
    try {
        std::vector<std::unique_ptr<Layer>> layers;
        layers.push_back(std::make_unique<Linear>(2, 2));
        layers.push_back(nullptr);
        Model m(std::move(layers));
    } catch (const TypeError&) {
        threw = true;
    }
    if (!threw) {
        std::cerr << "model_construction: null layer should throw TypeError" << std::endl;
        return false;
    }

    threw = false;
    try {
        std::vector<std::unique_ptr<Layer>> layers;
        layers.push_back(std::make_unique<Linear>(2, 3));
        layers.push_back(std::make_unique<Linear>(4, 2));
        Model m(std::move(layers));
    } catch (const ShapeError&) {
        threw = true;
    }
    if (!threw) {
        std::cerr << "model_construction: broken chain should throw ShapeError" << std::endl;
        return false;
    }

    if (!throws_value_error([] {
            ModelOptions options;
            options.train_metrics = track({"loss", "auc"});
            Model m(mlp_layers(), CrossEntropyLoss(), options);
        })) {
        std::cerr << "model_construction: unknown metric should throw ValueError" << std::endl;
        return false;
    }

    if (!throws_value_error([] {
            ModelOptions options;
            options.total_epochs = -1;
            Model m(mlp_layers(), CrossEntropyLoss(), options);
        })) {
        std::cerr << "model_construction: negative epochs should throw ValueError" << std::endl;
        return false;
    }

    Model model(mlp_layers());
    if (model.num_layers() != 4 || model.in_channels() != 4 || model.num_classes() != 3 ||
        model.num_parameters() != (4 * 6 + 6) + (6 * 3 + 3) || model.total_epochs() != 0) {
        std::cerr << "model_construction: wrong accessors" << std::endl;
        return false;
    }

    std::cout << "test_model_construction: PASSED" << std::endl;
    return true;
}

// Test 2: forward threads through every layer; eval reaches every layer
bool test_model_forward_eval() {
    Model model(mlp_layers());
    Generator gen(5);
    Tensor<float> x = Tensor<float>::randn({5, 4}, gen);

    auto out = model.forward(x);
    if (out.shape() != Shape{5, 3}) {
        std::cerr << "model_forward_eval: expected {5, 3}, got " << detail::shape_str(out.shape()) << std::endl;
        return false;
    }

    model.set_eval(true);
    model.set_eval(true);
    for (size_t i = 0; i < model.num_layers(); ++i) {
        if (!model.layer(i).is_eval()) {
            std::cerr << "model_forward_eval: layer " << i << " not in eval mode" << std::endl;
            return false;
        }
    }

    // Dropout is the identity in eval mode, so inference is deterministic
    if (model.forward(x) != model(x)) {
        std::cerr << "model_forward_eval: eval forward should be deterministic" << std::endl;
        return false;
    }

    model.set_eval(false);
    if (model.is_eval() || model.layer(2).is_eval()) {
        std::cerr << "model_forward_eval: eval mode should be switched off" << std::endl;
        return false;
    }

    std::cout << "test_model_forward_eval: PASSED" << std::endl;
    return true;
}

// Test 3: One train step on a single Linear layer is plain gradient descent
bool test_model_train_step() {
    Tensor<float> w({2, 2}, {0.5f, -0.5f, 0.25f, 0.75f});
    Tensor<float> b({2}, {0.0f, 0.1f});
    std::vector<std::unique_ptr<Layer>> layers;
    layers.push_back(std::make_unique<Linear>(w, b));
    Model model(std::move(layers));

    Tensor<float> x({2, 2}, {1.0f, 2.0f, -1.0f, 0.5f});
    std::vector<int> labels = {0, 1};
    const float lr = 0.5f;

    // Expected step computed independently
    Linear reference(w, b);
    CrossEntropyLoss ce;
    float expected_loss = ce.forward(reference.forward(x), labels);
    Tensor<float> g = (functional::softmax(matmul(x, w) + Tensor<float>({2, 2}, {0.0f, 0.1f, 0.0f, 0.1f})) -
                       functional::one_hot(labels, 2)) / 2.0f;
    Tensor<float> expected_w = w - matmul(x.transpose(), g) * lr;

    auto confusion = metrics::new_confusion_matrix(2);
    float loss = model.train_step(x, labels, lr, confusion);

    if (!float_eq(loss, expected_loss)) {
        std::cerr << "model_train_step: loss " << loss << ", expected " << expected_loss << std::endl;
        return false;
    }

    const auto& linear = dynamic_cast<const Linear&>(model.layer(0));
    if (!linear.weights().allclose(expected_w, 1e-4f, 1e-5f)) {
        std::cerr << "model_train_step: weights not updated by -lr * x^T g" << std::endl;
        return false;
    }

    if (confusion.total() != 2) {
        std::cerr << "model_train_step: confusion matrix should count 2 samples" << std::endl;
        return false;
    }

    std::cout << "test_model_train_step: PASSED" << std::endl;
    return true;
}

// Test 4: Repeated steps on one batch drive the loss down; evaluate_batch leaves parameters alone
bool test_model_learns_batch() {
    std::vector<std::unique_ptr<Layer>> layers;
    layers.push_back(std::make_unique<Linear>(2, 8, 3u));
    layers.push_back(std::make_unique<ReLU>(8));
    layers.push_back(std::make_unique<Linear>(8, 2, 4u));
    Model model(std::move(layers));

    Tensor<float> x({4, 2}, {1.0f, 1.0f, 1.0f, 0.8f, -1.0f, -1.0f, -0.8f, -1.0f});
    std::vector<int> labels = {0, 0, 1, 1};

    auto confusion = metrics::new_confusion_matrix(2);
    float first = model.evaluate_batch(x, labels, confusion);
    float again = model.evaluate_batch(x, labels, confusion);
    if (first != again) {
        std::cerr << "model_learns_batch: evaluate_batch should not change parameters" << std::endl;
        return false;
    }

    float last = first;
    for (int step = 0; step < 50; ++step) {
        last = model.train_step(x, labels, 0.5f, confusion);
    }

    if (!(last < first * 0.5f)) {
        std::cerr << "model_learns_batch: loss went from " << first << " to " << last << std::endl;
        return false;
    }

    confusion = metrics::new_confusion_matrix(2);
    model.evaluate_batch(x, labels, confusion);
    if (metrics::accuracy(confusion) != 1.0) {
        std::cerr << "model_learns_batch: should fit the batch" << std::endl;
        return false;
    }

    std::cout << "test_model_learns_batch: PASSED (loss " << first << " -> " << last << ")" << std::endl;
    return true;
}

// Test 5: Gradients through Linear -> ReLU -> Linear match central differences.
// Hidden pre-activations are all at least 0.15 away from the ReLU kink.
static const Tensor<float> kX({4, 2}, {1.0f, 2.0f, -1.0f, 0.5f, 0.5f, -1.0f, 2.0f, 1.0f});
static const std::vector<int> kLabels = {0, 1, 1, 0};
static const Tensor<float> kW1({2, 3}, {0.5f, -0.4f, 0.3f, 0.2f, 0.6f, -0.5f});
static const Tensor<float> kB1({3}, {0.1f, -0.2f, 0.05f});
static const Tensor<float> kW2({3, 2}, {0.3f, -0.2f, -0.1f, 0.4f, 0.25f, 0.15f});
static const Tensor<float> kB2({2}, {0.0f, 0.05f});

static Model chain_model(const Tensor<float>& w1, const Tensor<float>& b1, Reduction reduction) {
    std::vector<std::unique_ptr<Layer>> layers;
    layers.push_back(std::make_unique<Linear>(w1, b1));
    layers.push_back(std::make_unique<ReLU>(3));
    layers.push_back(std::make_unique<Linear>(kW2, kB2));
    return Model(std::move(layers), CrossEntropyLoss(reduction));
}

static float chain_loss(const Tensor<float>& w1, const Tensor<float>& b1) {
    Model model = chain_model(w1, b1, Reduction::Mean);
    auto confusion = metrics::new_confusion_matrix(2);
    return model.evaluate_batch(kX, kLabels, confusion);
}

bool test_model_chain_gradient() {
    const float eps = 1e-2f;

    Model model = chain_model(kW1, kB1, Reduction::Mean);
    auto confusion = metrics::new_confusion_matrix(2);
    model.train_step(kX, kLabels, 0.1f, confusion);
    const auto& first = dynamic_cast<const Linear&>(model.layer(0));

    for (size_t i = 0; i < kW1.numel(); ++i) {
        Tensor<float> plus = kW1, minus = kW1;
        plus[i] += eps;
        minus[i] -= eps;
        float numeric = (chain_loss(plus, kB1) - chain_loss(minus, kB1)) / (2.0f * eps);
        if (!float_eq(first.weight_grad()[i], numeric, 1e-3f)) {
            std::cerr << "model_chain_gradient: dW1[" << i << "] analytic " << first.weight_grad()[i]
                      << ", numeric " << numeric << std::endl;
            return false;
        }
    }

    for (size_t i = 0; i < kB1.numel(); ++i) {
        Tensor<float> plus = kB1, minus = kB1;
        plus[i] += eps;
        minus[i] -= eps;
        float numeric = (chain_loss(kW1, plus) - chain_loss(kW1, minus)) / (2.0f * eps);
        if (!float_eq(first.bias_grad()[i], numeric, 1e-3f)) {
            std::cerr << "model_chain_gradient: db1[" << i << "] analytic " << first.bias_grad()[i]
                      << ", numeric " << numeric << std::endl;
            return false;
        }
    }

    // Sum reduction is not averaged anywhere: gradients are batch_size times larger
    Model summed = chain_model(kW1, kB1, Reduction::Sum);
    confusion = metrics::new_confusion_matrix(2);
    summed.train_step(kX, kLabels, 0.1f, confusion);
    const auto& summed_first = dynamic_cast<const Linear&>(summed.layer(0));
    if (!summed_first.weight_grad().allclose(first.weight_grad() * 4.0f, 1e-4f, 1e-6f)) {
        std::cerr << "model_chain_gradient: sum gradient should be 4x the mean gradient" << std::endl;
        return false;
    }

    std::cout << "test_model_chain_gradient: PASSED" << std::endl;
    return true;
}

// Test 6: JSON form
bool test_model_json() {
    ModelOptions options;
    options.total_epochs = 3;
    options.train_metrics = {{"loss", {0.9, 0.5, 0.25}}, {"accuracy", {0.5, 0.75, 1.0}}};
    options.validation_metrics = track({"f1_score"});
    Model model(mlp_layers(), CrossEntropyLoss(Reduction::Sum), options);

    auto j = model.to_json();
    if (j["class"] != "Model" || j["epochs"] != 3 || j["layers"].size() != 4 ||
        j["loss"]["reduction"] != "sum" || j["train_metrics"]["loss"].size() != 3 ||
        !j["validation_metrics"]["f1_score"].empty()) {
        std::cerr << "model_json: unexpected JSON " << j.dump() << std::endl;
        return false;
    }

    Model restored = Model::from_json(j);
    if (restored != model || restored.total_epochs() != 3 ||
        restored.history("train", "accuracy") != std::vector<double>{0.5, 0.75, 1.0} ||
        restored.validation_metrics().count("f1_score") != 1) {
        std::cerr << "model_json: from_json(to_json()) should reproduce the model" << std::endl;
        return false;
    }

    Model other(mlp_layers(2), CrossEntropyLoss(Reduction::Sum));
    if (other == model) {
        std::cerr << "model_json: different parameters should compare unequal" << std::endl;
        return false;
    }

    auto wrong_class = j;
    wrong_class["class"] = "Sequential";
    if (!throws_value_error([&] { Model::from_json(wrong_class); })) {
        std::cerr << "model_json: wrong class should throw ValueError" << std::endl;
        return false;
    }

    auto bad_history = j;
    bad_history["train_metrics"]["loss"] = "high";
    bool threw = false;
    try {
        Model::from_json(bad_history);
    } catch (const TypeError&) {
        threw = true;
    }
    if (!threw) {
        std::cerr << "model_json: non-array history should throw TypeError" << std::endl;
        return false;
    }

    if (!throws_value_error([&] { model.history("train", "recall"); })) {
        std::cerr << "model_json: untracked metric should throw ValueError" << std::endl;
        return false;
    }

    std::cout << "test_model_json: PASSED" << std::endl;
    return true;
}

// Test 7: Per-class histories sit beside the macro averages and survive JSON
bool test_model_class_history() {
    ModelOptions options;
    options.total_epochs = 2;
    options.validation_metrics = {{"loss", {0.8, 0.6}}, {"recall", {0.5, 0.75}}};
    options.validation_class_metrics = {{"recall", {{0.0, 1.0, 0.5}, {0.5, 1.0, 0.75}}}};
    options.train_metrics = track({"precision"});
    Model model(mlp_layers(), CrossEntropyLoss(), options);

    // Tracked per-class metrics start with an empty per-class history
    if (!model.class_history("train", "precision").empty() ||
        model.class_history("validation", "recall").size() != 2 ||
        model.validation_class_metrics().count("loss") != 0) {
        std::cerr << "model_class_history: unexpected per-class histories" << std::endl;
        return false;
    }

    Model restored = Model::from_json(model.to_json());
    if (restored.class_history("validation", "recall") != model.class_history("validation", "recall") ||
        !restored.class_history("train", "precision").empty()) {
        std::cerr << "model_class_history: per-class history lost in JSON" << std::endl;
        return false;
    }

    // Documents without per-class fields still load
    auto legacy = model.to_json();
    legacy.erase("validation_class_metrics");
    legacy.erase("train_class_metrics");
    if (!Model::from_json(legacy).class_history("validation", "recall").empty()) {
        std::cerr << "model_class_history: missing field should give an empty history" << std::endl;
        return false;
    }

    if (!throws_value_error([&] { model.class_history("validation", "loss"); }) ||
        !throws_value_error([&] { model.class_history("train", "f1_score"); }) ||
        !throws_value_error([&] { model.class_history("test", "recall"); })) {
        std::cerr << "model_class_history: non per-class or untracked metric should throw ValueError" << std::endl;
        return false;
    }

    // Per-class entries must belong to a tracked per-class metric
    if (!throws_value_error([] {
            ModelOptions bad;
            bad.validation_metrics = track({"loss"});
            bad.validation_class_metrics = {{"loss", {{0.5}}}};
            Model m(mlp_layers(), CrossEntropyLoss(), bad);
        })) {
        std::cerr << "model_class_history: loss has no per-class history" << std::endl;
        return false;
    }
    if (!throws_value_error([] {
            ModelOptions bad;
            bad.validation_metrics = {{"recall", {0.5}}};
            bad.validation_class_metrics = {{"recall", {{0.5, 0.5}, {1.0, 1.0}}}};
            Model m(mlp_layers(), CrossEntropyLoss(), bad);
        })) {
        std::cerr << "model_class_history: more per-class epochs than history should throw" << std::endl;
        return false;
    }

    auto bad_row = model.to_json();
    bad_row["validation_class_metrics"]["recall"][0] = 0.5;
    bool threw = false;
    try {
        Model::from_json(bad_row);
    } catch (const TypeError&) {
        threw = true;
    }
    if (!threw) {
        std::cerr << "model_class_history: non-array epoch row should throw TypeError" << std::endl;
        return false;
    }

    std::cout << "test_model_class_history: PASSED" << std::endl;
    return true;
}

int main() {
    std::cout << "=== Model Tests ===" << std::endl;

    int failures = 0;

    if (!test_model_construction()) ++failures;
    if (!test_model_forward_eval()) ++failures;
    if (!test_model_train_step()) ++failures;
    if (!test_model_learns_batch()) ++failures;
    if (!test_model_chain_gradient()) ++failures;
    if (!test_model_json()) ++failures;
    if (!test_model_class_history()) ++failures;

    if (failures > 0) {
        std::cerr << failures << " test(s) FAILED" << std::endl;
        return 1;
    }

    std::cout << "=== All model tests passed (7/7) ===" << std::endl;
    return 0;
}
