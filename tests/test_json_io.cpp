#include <gtest/gtest.h>

#include <fstream>
#include <stdexcept>
#include <string>

#include "io/Config.hpp"
#include "io/JsonIO.hpp"
#include "reco/RecommendationsArtifact.hpp"
#include "test_helpers.hpp"

using namespace testutil;

namespace {

// runs fn and returns the runtime_error message, or "" if nothing was thrown
template <typename Fn>
std::string error_of(Fn fn) {
    try {
        fn();
    } catch (const std::runtime_error& e) {
        return e.what();
    }
    return {};
}

}  // namespace

class JsonIOTest : public ::testing::Test {
protected:
    void SetUp() override { dir_ = fresh_temp_dir("json_io"); }

    std::string write(const std::string& name, const std::string& body) {
        const auto p = dir_ / name;
        write_text(p, body);
        return p.string();
    }

    std::filesystem::path dir_;
};

TEST_F(JsonIOTest, LoadsCatalog) {
    const auto path = write("catalog.json", R"({"movies": [
        {"id": 1, "title": "Alien", "popularity": 88.5, "genres": ["Horror", "Science Fiction"]},
        {"id": 2, "title": "Up"}
    ]})");

    const auto movies = loadCatalog(path);
    ASSERT_EQ(movies.size(), 2u);
    EXPECT_EQ(movies[0].title, "Alien");
    EXPECT_DOUBLE_EQ(movies[0].popularity, 88.5);
    EXPECT_EQ(movies[0].genres.count("Horror"), 1u);
    EXPECT_DOUBLE_EQ(movies[1].popularity, 0.0);
    EXPECT_TRUE(movies[1].genres.empty());

    const JsonCatalog catalog(movies);
    EXPECT_EQ(catalog.size(), 2u);
    EXPECT_EQ(catalog.movie_ids(), (std::vector<reco::MovieId>{1, 2}));
    EXPECT_EQ(catalog.title(1), "Alien");
    EXPECT_TRUE(catalog.genres(3).empty());
    EXPECT_DOUBLE_EQ(catalog.popularity(3), 0.0);
}

TEST_F(JsonIOTest, CatalogErrorsNameTheField) {
    const auto bad_genre = write("bad_genre.json", R"({"movies": [{"id": 1, "genres": ["Drama", 7]}]})");
    EXPECT_NE(error_of([&] { loadCatalog(bad_genre); }).find("root.movies[0].genres[1]"), std::string::npos);

    const auto no_id = write("no_id.json", R"({"movies": [{"id": 1}, {"title": "x"}]})");
    EXPECT_NE(error_of([&] { loadCatalog(no_id); }).find("root.movies[1]"), std::string::npos);

    EXPECT_THROW(loadCatalog((dir_ / "missing.json").string()), std::runtime_error);
    EXPECT_THROW(loadCatalog(write("garbage.json", "[1,")), std::runtime_error);
}

TEST_F(JsonIOTest, DuplicateCatalogIdThrows) {
    CatalogMovie a;
    a.id = 4;
    EXPECT_THROW(JsonCatalog({a, a}), std::runtime_error);
}

TEST_F(JsonIOTest, LoadsInteractionsAndGroupsByUser) {
    const auto path = write("interactions.json", R"({"interactions": [
        {"user_id": 1, "movie_id": 10, "action": "watch", "timestamp": 100},
        {"user_id": 2, "movie_id": 11, "action": "rate", "rating": 7.5, "timestamp": 200},
        {"user_id": 1, "movie_id": 12, "action": "skip", "rating": null, "timestamp": 300},
        {"user_id": 1, "movie_id": 13, "action": "watchlist", "timestamp": 400}
    ]})");

    const auto records = loadInteractions(path);
    ASSERT_EQ(records.size(), 4u);
    EXPECT_EQ(records[1].action, reco::Action::Rate);
    ASSERT_TRUE(records[1].rating.has_value());
    EXPECT_DOUBLE_EQ(*records[1].rating, 7.5);
    EXPECT_FALSE(records[2].rating.has_value());

    const JsonInteractionReader reader(records);
    const auto user1 = reader.get(1);
    ASSERT_EQ(user1.size(), 3u);
    EXPECT_EQ(user1[2].action, reco::Action::Watchlist);
    EXPECT_TRUE(reader.get(3).empty());
}

TEST_F(JsonIOTest, InteractionErrors) {
    const auto bad_action = write("bad_action.json", R"({"interactions": [
        {"user_id": 1, "movie_id": 10, "action": "like", "timestamp": 1}]})");
    EXPECT_NE(error_of([&] { loadInteractions(bad_action); }).find("root.interactions[0].action"),
              std::string::npos);

    const auto bad_rating = write("bad_rating.json", R"({"interactions": [
        {"user_id": 1, "movie_id": 10, "action": "rate", "rating": 11, "timestamp": 1}]})");
    EXPECT_THROW(loadInteractions(bad_rating), std::runtime_error);

    const auto no_array = write("no_array.json", R"({"events": []})");
    EXPECT_THROW(loadInteractions(no_array), std::runtime_error);
}

TEST(ActionTest, ParseAndPrint) {
    reco::Action a = reco::Action::Watch;
    EXPECT_TRUE(reco::parse_action("skip", a));
    EXPECT_EQ(a, reco::Action::Skip);
    EXPECT_STREQ(reco::action_str(reco::Action::Watchlist), "watchlist");
    EXPECT_FALSE(reco::parse_action("SKIP!", a));
}

TEST_F(JsonIOTest, ConfigOverridesOnlyGivenKeys) {
    const auto path = write("config.json", R"({
        "embeddings": "/srv/emb.bin",
        "max_k": 20,
        "default_lambda": 0.5,
        "exclude_rated": true,
        "signals": {"half_life_days": 7}
    })");

    const RecommenderConfig cfg = loadConfig(path);
    EXPECT_EQ(cfg.matrix_path, "/srv/emb.bin");
    EXPECT_EQ(cfg.index_path, "data/embedding_index.json");
    EXPECT_EQ(cfg.max_k, 20);
    EXPECT_EQ(cfg.default_k, 10);
    EXPECT_DOUBLE_EQ(cfg.default_lambda, 0.5);
    EXPECT_TRUE(cfg.exclude_rated);
    EXPECT_DOUBLE_EQ(cfg.signals.half_life_days, 7.0);
    EXPECT_DOUBLE_EQ(cfg.signals.dislike_threshold, 5.0);
}

TEST_F(JsonIOTest, ConfigRejectsBadValues) {
    EXPECT_NE(error_of([&] { loadConfig(write("c1.json", R"({"max_k": "ten"})")); }).find("config.max_k"),
              std::string::npos);
    EXPECT_THROW(loadConfig(write("c2.json", R"({"max_k": 0})")), std::runtime_error);
    EXPECT_THROW(loadConfig(write("c3.json", R"({"signals": {"half_life_days": 0}})")), std::runtime_error);
    EXPECT_THROW(loadConfig(write("c4.json", R"({"popularity_divisor": -1})")), std::runtime_error);
    EXPECT_THROW(loadConfig(write("c5.json", "[]")), std::runtime_error);
    EXPECT_NE(error_of([&] { loadConfig(write("c6.json", R"({"signals": {"normalize_epsilon": 0}})")); })
                  .find("config.signals.normalize_epsilon"),
              std::string::npos);
    EXPECT_THROW(loadConfig(write("c7.json", R"({"signals": {"normalize_epsilon": -1e-8}})")), std::runtime_error);
    EXPECT_THROW(loadConfig((dir_ / "nope.json").string()), std::runtime_error);
}

TEST_F(JsonIOTest, RecommendationsArtifactLayout) {
    reco::RecommendationsArtifact art;
    art.user_id = 7;
    art.k = 2;
    art.lambda = 0.7;
    art.result.watched_count = 1;

    reco::Recommendation r;
    r.movie_id = 2;
    r.title = "Second";
    r.combined_score = 0.4;
    r.explanation.interest = 0.16;
    r.explanation.collaborative = 0.24;
    r.explanation.total = 0.4;
    art.result.items.push_back(r);

    const auto j = art.to_json();
    EXPECT_EQ(j.at("user_id").get<long long>(), 7);
    EXPECT_FALSE(j.at("cold_start").get<bool>());
    EXPECT_EQ(j.at("weights").at("tier").get<std::string>(), "sparse");
    ASSERT_EQ(j.at("recommendations").size(), 1u);
    EXPECT_EQ(j.at("recommendations")[0].at("title").get<std::string>(), "Second");
    EXPECT_DOUBLE_EQ(j.at("recommendations")[0].at("explanation").at("collaborative").get<double>(), 0.24);

    const auto out = dir_ / "out" / "recs.json";
    art.write_to(out);
    std::ifstream in(out);
    const auto reread = nlohmann::json::parse(in);
    EXPECT_EQ(reread, j);
}

TEST_F(JsonIOTest, SimilarItemsArtifactOmitsMissingTitles) {
    reco::SimilarItemsArtifact art;
    art.query = "movie:1";
    art.hits = {{2, 0.8}, {3, 0.6}};

    const auto j = art.to_json();
    EXPECT_EQ(j.at("query").get<std::string>(), "movie:1");
    ASSERT_EQ(j.at("results").size(), 2u);
    EXPECT_FALSE(j.at("results")[0].contains("title"));
    EXPECT_DOUBLE_EQ(j.at("results")[1].at("similarity").get<double>(), 0.6);
}
