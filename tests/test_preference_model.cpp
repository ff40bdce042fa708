#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>
#include "navis/preference_model.hpp"
#include <algorithm>
#include <cmath>
#include <filesystem>
#include <fstream>
#include <limits>

using Catch::Approx;
using namespace navis;

namespace
{
    PreferenceFeatures strong_features()
    {
        return PreferenceFeatures{0.9, 0.1, 0.2, 0.1, 1.0};
    }

    PreferenceFeatures weak_features()
    {
        return PreferenceFeatures{0.2, 0.6, 0.8, 0.9, 0.0};
    }

    std::vector<TrainingSample> positive_batch(std::size_t n)
    {
        return std::vector<TrainingSample>(n, TrainingSample{strong_features(), 1.0});
    }

    std::filesystem::path temp_model_path(const std::string &name)
    {
        auto path = std::filesystem::temp_directory_path() / ("navis_test_" + name + ".json");
        std::filesystem::remove(path);
        return path;
    }
}

TEST_CASE("A cold model predicts exactly one half", "[preference]")
{
    PreferenceModel model;
    REQUIRE(model.is_cold());
    REQUIRE(model.update_count() == 0);
    REQUIRE(model.predict(strong_features()) == 0.5);
    REQUIRE(model.predict(weak_features()) == 0.5);
    REQUIRE(model.predict(PreferenceFeatures{}) == 0.5);
}

TEST_CASE("Updates move predictions towards the target", "[preference]")
{
    PreferenceModel model;

    SECTION("positive rewards raise the preference")
    {
        REQUIRE(model.update(positive_batch(10)));
        REQUIRE(model.predict(strong_features()) > 0.5);
        REQUIRE_FALSE(model.is_cold());
        REQUIRE(model.update_count() == 1);
    }

    SECTION("negative rewards lower the preference")
    {
        std::vector<TrainingSample> batch(10, TrainingSample{strong_features(), 0.0});
        REQUIRE(model.update(batch));
        REQUIRE(model.predict(strong_features()) < 0.5);
    }

    SECTION("predictions stay in the unit interval")
    {
        for (int i = 0; i < 50; ++i)
            REQUIRE(model.update(positive_batch(10)));
        double p = model.predict(strong_features());
        REQUIRE(p > 0.5);
        REQUIRE(p <= 1.0);
        REQUIRE(model.update_count() == 50);
    }
}

TEST_CASE("Identical batches produce identical weights", "[preference]")
{
    PreferenceModel a;
    PreferenceModel b;
    std::vector<TrainingSample> batch = {
        {strong_features(), 1.0},
        {weak_features(), 0.0},
        {strong_features(), 0.75},
    };

    REQUIRE(a.update(batch));
    REQUIRE(b.update(batch));

    auto wa = a.weights();
    auto wb = b.weights();
    REQUIRE(wa.bias == wb.bias);
    REQUIRE(wa.weights == wb.weights);
    REQUIRE(a.predict(weak_features()) == b.predict(weak_features()));
}

TEST_CASE("Rejected batches leave the weights untouched", "[preference]")
{
    PreferenceModel model;
    REQUIRE(model.update(positive_batch(3)));
    auto before = model.weights();

    SECTION("empty batch")
    {
        auto result = model.update({});
        REQUIRE_FALSE(result);
        REQUIRE(result.error().code == ErrorCode::ModelUpdateFailure);
    }

    SECTION("target outside the unit interval")
    {
        auto batch = positive_batch(3);
        batch[1].target = 1.5;
        auto result = model.update(batch);
        REQUIRE_FALSE(result);
        REQUIRE(result.error().code == ErrorCode::ModelUpdateFailure);
    }

    SECTION("non-finite feature")
    {
        auto batch = positive_batch(3);
        batch[2].features.text_length = std::numeric_limits<double>::quiet_NaN();
        auto result = model.update(batch);
        REQUIRE_FALSE(result);
        REQUIRE(result.error().code == ErrorCode::ModelUpdateFailure);
    }

    auto after = model.weights();
    REQUIRE(after.bias == before.bias);
    REQUIRE(after.weights == before.weights);
    REQUIRE(model.update_count() == 1);
}

TEST_CASE("Exploration decays towards its floor", "[preference]")
{
    PreferenceModel::Config cfg;
    cfg.exploration_rate = 0.1;
    cfg.exploration_decay = 0.5;
    cfg.min_exploration_rate = 0.02;
    PreferenceModel model(cfg);

    REQUIRE(model.exploration_rate() == Approx(0.1));
    REQUIRE(model.decay_exploration() == Approx(0.05));
    REQUIRE(model.decay_exploration() == Approx(0.025));
    REQUIRE(model.decay_exploration() == Approx(0.02));
    REQUIRE(model.decay_exploration() == Approx(0.02));

    SECTION("reset raises the rate again")
    {
        model.reset_exploration(0.8);
        REQUIRE(model.exploration_rate() == Approx(0.8));
    }

    SECTION("reset never goes below the floor")
    {
        model.reset_exploration(0.0);
        REQUIRE(model.exploration_rate() == Approx(0.02));
    }
}

TEST_CASE("Default decay matches the configured schedule", "[preference]")
{
    PreferenceModel model;
    double expected = 0.1;
    for (int i = 0; i < 10; ++i)
    {
        expected = std::max(0.01, expected * 0.995);
        REQUIRE(model.decay_exploration() == Approx(expected));
    }
}

TEST_CASE("Model weights survive a save and load", "[preference]")
{
    auto path = temp_model_path("roundtrip");

    PreferenceModel trained;
    REQUIRE(trained.update(positive_batch(5)));
    trained.decay_exploration();
    REQUIRE(trained.save(path.string()));

    PreferenceModel restored;
    REQUIRE(restored.load(path.string()));
    REQUIRE(restored.predict(strong_features()) == Approx(trained.predict(strong_features())));
    REQUIRE(restored.exploration_rate() == Approx(trained.exploration_rate()));
    REQUIRE(restored.update_count() == 1);

    std::filesystem::remove(path);
}

TEST_CASE("Loading a model file with the wrong arity fails", "[preference]")
{
    auto path = temp_model_path("arity");
    {
        std::ofstream out(path);
        out << R"({"version":1,"bias":0.1,"weights":[0.1,0.2,0.3]})";
    }

    PreferenceModel model;
    auto result = model.load(path.string());
    REQUIRE_FALSE(result);
    REQUIRE(result.error().code == ErrorCode::ValidationError);
    REQUIRE(model.is_cold());

    std::filesystem::remove(path);
}

TEST_CASE("Loading a missing or corrupt model file fails", "[preference]")
{
    PreferenceModel model;

    auto missing = model.load((std::filesystem::temp_directory_path() / "navis_no_such_model.json").string());
    REQUIRE_FALSE(missing);
    REQUIRE(missing.error().code == ErrorCode::IOError);

    auto path = temp_model_path("corrupt");
    {
        std::ofstream out(path);
        out << "{not json";
    }
    auto corrupt = model.load(path.string());
    REQUIRE_FALSE(corrupt);
    REQUIRE(corrupt.error().code == ErrorCode::ParsingError);
    REQUIRE(model.is_cold());

    std::filesystem::remove(path);
}

TEST_CASE("Features are derived from a candidate", "[preference]")
{
    Candidate c;
    c.element.text = std::string(50, 'x');
    c.element.tag = "button";
    c.element.bounds = {960.0 - 50.0, 540.0 - 20.0, 100.0, 40.0};
    c.scores.text_match = 1.0;
    c.scores.semantic_relevance = 1.0;
    c.scores.contextual_position = 1.0;
    c.scores.visual_prominence = 1.0;

    Intent intent;
    intent.expected_element_types = {"button"};

    auto f = PreferenceFeatures::from_candidate(c, intent, PageContext{}, ScoringWeights{});
    REQUIRE(f.base_score == Approx(1.0));
    REQUIRE(f.text_length == Approx(0.5));
    REQUIRE(f.normalized_x == Approx(0.5));
    REQUIRE(f.normalized_y == Approx(0.5));
    REQUIRE(f.type_match == 1.0);
    REQUIRE(f.to_vector().size() == PreferenceFeatures::kFeatureCount);
}
