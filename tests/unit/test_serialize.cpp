// Serialization Tests

#include <seqnet/serialize.hpp>
#include <iostream>
#include <fstream>
#include <filesystem>

using namespace seqnet;
using namespace seqnet::nn;

namespace fs = std::filesystem;

static fs::path test_dir() {
    return fs::temp_directory_path() / "seqnet_test_serialize";
}

// Create a small test model with some recorded history
Model create_test_model() {
    Generator gen(42);
    std::vector<std::unique_ptr<Layer>> layers;
    layers.push_back(std::make_unique<Linear>(4, 3, gen));
    layers.push_back(std::make_unique<ReLU>(3));
    layers.push_back(std::make_unique<Dropout>(3, 0.25f, gen.fork()));
    layers.push_back(std::make_unique<Linear>(3, 2, gen));

    ModelOptions options;
    options.total_epochs = 2;
    options.train_metrics = {{"loss", {0.7, 0.4}}, {"accuracy", {0.5, 0.8125}}};
    options.validation_metrics = {{"loss", {0.75, 0.5}}};
    return Model(std::move(layers), CrossEntropyLoss(Reduction::Mean), options);
}

// Test 1: Save and load in both formats
bool test_save_load() {
    Model original = create_test_model();

    for (const char* name : {"model.json", "model.msgpack"}) {
        fs::path path = test_dir() / name;

        try {
            save_model(path, original);
        } catch (const SerializeError& e) {
            std::cerr << "save_load: save failed: " << e.what() << std::endl;
            return false;
        }

        Model loaded = load_model(path);
        if (loaded != original) {
            std::cerr << "save_load: " << name << " parameters differ after reload" << std::endl;
            return false;
        }
        if (loaded.total_epochs() != 2 ||
            loaded.history("train", "accuracy") != original.history("train", "accuracy") ||
            loaded.history("validation", "loss") != std::vector<double>{0.75, 0.5}) {
            std::cerr << "save_load: " << name << " history differs after reload" << std::endl;
            return false;
        }

        // Reloaded model produces the same predictions
        Generator gen(7);
        Tensor<float> x = Tensor<float>::randn({3, 4}, gen);
        original.set_eval(true);
        loaded.set_eval(true);
        if (!original.forward(x).allclose(loaded.forward(x))) {
            std::cerr << "save_load: " << name << " forward differs after reload" << std::endl;
            return false;
        }
        original.set_eval(false);
    }

    // The binary form is the smaller one
    if (fs::file_size(test_dir() / "model.msgpack") >= fs::file_size(test_dir() / "model.json")) {
        std::cerr << "save_load: msgpack file should be smaller than JSON" << std::endl;
        return false;
    }

    std::cout << "test_save_load: PASSED" << std::endl;
    return true;
}

// Test 2: Format selection
bool test_model_format() {
    if (model_format("a/b.json") != ModelFormat::JSON || model_format("b.msgpack") != ModelFormat::MSGPACK) {
        std::cerr << "model_format: wrong format for known extensions" << std::endl;
        return false;
    }

    for (const char* bad : {"model.pkl", "model", "model.JSON"}) {
        bool threw = false;
        try {
            save_model(test_dir() / bad, create_test_model());
        } catch (const ValueError&) {
            threw = true;
        }
        if (!threw) {
            std::cerr << "model_format: '" << bad << "' should throw ValueError" << std::endl;
            return false;
        }
        if (fs::exists(test_dir() / bad)) {
            std::cerr << "model_format: nothing should be written for '" << bad << "'" << std::endl;
            return false;
        }
    }

    std::cout << "test_model_format: PASSED" << std::endl;
    return true;
}

// Test 3: Unreadable and invalid files
bool test_load_errors() {
    bool threw = false;
    try {
        load_model(test_dir() / "missing.json");
    } catch (const SerializeError&) {
        threw = true;
    }
    if (!threw) {
        std::cerr << "load_errors: missing file should throw SerializeError" << std::endl;
        return false;
    }

    fs::path garbage = test_dir() / "garbage.json";
    std::ofstream(garbage) << "{ not json";
    threw = false;
    try {
        load_model(garbage);
    } catch (const SerializeError&) {
        threw = true;
    }
    if (!threw) {
        std::cerr << "load_errors: malformed JSON should throw SerializeError" << std::endl;
        return false;
    }

    fs::path garbage_bin = test_dir() / "garbage.msgpack";
    {
        std::ofstream out(garbage_bin, std::ios::binary);
        out.put(static_cast<char>(0xc1));  // never used in MessagePack
    }
    threw = false;
    try {
        load_model(garbage_bin);
    } catch (const SerializeError&) {
        threw = true;
    }
    if (!threw) {
        std::cerr << "load_errors: malformed MessagePack should throw SerializeError" << std::endl;
        return false;
    }

    // Well-formed document describing something else
    fs::path other = test_dir() / "other.json";
    std::ofstream(other) << R"({"class": "Tokenizer", "vocab": []})";
    threw = false;
    try {
        load_model(other);
    } catch (const ValueError&) {
        threw = true;
    }
    if (!threw) {
        std::cerr << "load_errors: wrong class should throw ValueError" << std::endl;
        return false;
    }

    // Right class, wrong field types
    auto doc = create_test_model().to_json();
    doc["epochs"] = "two";
    fs::path mistyped = test_dir() / "mistyped.json";
    std::ofstream(mistyped) << doc.dump();
    threw = false;
    try {
        load_model(mistyped);
    } catch (const TypeError&) {
        threw = true;
    }
    if (!threw) {
        std::cerr << "load_errors: mistyped field should throw TypeError" << std::endl;
        return false;
    }

    std::cout << "test_load_errors: PASSED" << std::endl;
    return true;
}

// Test 4: Writing into a directory that does not exist
bool test_save_errors() {
    bool threw = false;
    try {
        save_model(test_dir() / "no" / "such" / "dir" / "model.json", create_test_model());
    } catch (const SerializeError&) {
        threw = true;
    }
    if (!threw) {
        std::cerr << "save_errors: unwritable path should throw SerializeError" << std::endl;
        return false;
    }

    std::cout << "test_save_errors: PASSED" << std::endl;
    return true;
}

int main() {
    std::cout << "=== Serialization Tests ===" << std::endl;

    fs::remove_all(test_dir());
    fs::create_directories(test_dir());

    int failures = 0;

    if (!test_save_load()) ++failures;
    if (!test_model_format()) ++failures;
    if (!test_load_errors()) ++failures;
    if (!test_save_errors()) ++failures;

    fs::remove_all(test_dir());

    if (failures > 0) {
        std::cerr << failures << " test(s) FAILED" << std::endl;
        return 1;
    }

    std::cout << "=== All serialization tests passed (4/4) ===" << std::endl;
    return 0;
}
