#include "store/formats_registry.hpp"

#include "common/cup_fixtures.hpp"
#include "core/json_dom.hpp"

#include <catch2/catch_test_macros.hpp>

#include <filesystem>
#include <string>
#include <vector>

namespace fs = std::filesystem;
namespace json = cupkit::core::json;
using cupkit::core::errors::ErrorKind;
using cupkit::core::errors::OpError;
using cupkit::store::FormatsRegistry;

namespace {

json::Value Entry(const std::string& cup, const std::string& title) {
  json::Value entry = json::MakeObject();
  json::SetField(entry, "title", json::MakeString(title));
  json::SetField(entry, "cup", json::MakeString(cup));
  json::SetField(entry, "cp", json::MakeNumber(1500));
  json::SetField(entry, "meta", json::MakeString(cup));
  return entry;
}

std::vector<std::string> Cups(const FormatsRegistry& registry) {
  std::vector<std::string> cups;
  for (const auto& entry : registry.List()) {
    cups.emplace_back(json::StringField(entry, "cup"));
  }
  return cups;
}

FormatsRegistry LoadFixture(const fs::path& root) {
  cupkit::tests::common::WriteFileOrFail(root / "formats.json",
                                         cupkit::tests::common::kRegistryWithSpring);
  FormatsRegistry registry;
  OpError error;
  REQUIRE(FormatsRegistry::Load(root / "formats.json", registry, error));
  return registry;
}

} // namespace

TEST_CASE("Load treats a missing registry as empty and rejects non-arrays", "[store][registry]") {
  const cupkit::tests::common::ScratchRoot scratch("cupkit-registry-load");
  const fs::path& root = scratch.Path();

  FormatsRegistry registry;
  OpError error;
  REQUIRE(FormatsRegistry::Load(root / "formats.json", registry, error));
  REQUIRE(registry.List().empty());

  cupkit::tests::common::WriteFileOrFail(root / "formats.json", R"({"cup":"spring"})");
  REQUIRE_FALSE(FormatsRegistry::Load(root / "formats.json", registry, error));
  REQUIRE(error.kind == ErrorKind::kParseError);
}

TEST_CASE("Upsert replaces in place, appends new cups and never duplicates", "[store][registry]") {
  FormatsRegistry registry;
  OpError error;
  REQUIRE(registry.Upsert(Entry("all", "Great League"), error));
  REQUIRE(registry.Upsert(Entry("spring", "Spring Cup"), error));
  REQUIRE(registry.Upsert(Entry("summer", "Summer Cup"), error));
  REQUIRE(registry.Upsert(Entry("spring", "Spring Cup v2"), error));
  REQUIRE(registry.Upsert(Entry("spring", "Spring Cup v3"), error));

  REQUIRE(Cups(registry) == std::vector<std::string>{"all", "spring", "summer"});
  REQUIRE(json::StringField(registry.List()[1], "title") == "Spring Cup v3");

  json::Value no_cup = json::MakeObject();
  json::SetField(no_cup, "title", json::MakeString("Orphan"));
  REQUIRE_FALSE(registry.Upsert(no_cup, error));
  REQUIRE(error.kind == ErrorKind::kMissingField);
  REQUIRE(registry.List().size() == 3U);
}

TEST_CASE("FindByCup and Remove", "[store][registry]") {
  const cupkit::tests::common::ScratchRoot scratch("cupkit-registry-find");
  const fs::path& root = scratch.Path();
  FormatsRegistry registry = LoadFixture(root);

  json::Value entry;
  OpError error;
  REQUIRE(registry.FindByCup("spring", entry, error));
  REQUIRE(json::StringField(entry, "title") == "Spring Cup");

  REQUIRE_FALSE(registry.FindByCup("winter", entry, error));
  REQUIRE(error.kind == ErrorKind::kNotFound);

  REQUIRE(registry.Remove("winter") == 0U);
  REQUIRE(registry.Remove("spring") == 1U);
  REQUIRE(Cups(registry) == std::vector<std::string>{"all"});
}

TEST_CASE("RenameCup rewrites only cup and title", "[store][registry]") {
  const cupkit::tests::common::ScratchRoot scratch("cupkit-registry-rename");
  const fs::path& root = scratch.Path();
  FormatsRegistry registry = LoadFixture(root);

  OpError error;
  REQUIRE(registry.RenameCup("spring", "blossom", "Blossom Cup", error));
  const json::Value& renamed = registry.List()[1];
  REQUIRE(json::StringField(renamed, "cup") == "blossom");
  REQUIRE(json::StringField(renamed, "title") == "Blossom Cup");
  REQUIRE(json::StringField(renamed, "meta") == "spring");
  REQUIRE(json::FindField(renamed, "showCup") != nullptr);
  REQUIRE(json::StringField(registry.List()[0], "cup") == "all");

  REQUIRE_FALSE(registry.RenameCup("spring", "other", "Other", error));
  REQUIRE(error.kind == ErrorKind::kNotFound);
}

TEST_CASE("CloneEntry appends a copy pointing at the new cup", "[store][registry]") {
  const cupkit::tests::common::ScratchRoot scratch("cupkit-registry-clone");
  const fs::path& root = scratch.Path();
  FormatsRegistry registry = LoadFixture(root);

  OpError error;
  REQUIRE(registry.CloneEntry("spring", "spring2", "Spring Cup II", error));
  REQUIRE(Cups(registry) == std::vector<std::string>{"all", "spring", "spring2"});
  const json::Value& clone = registry.List().back();
  REQUIRE(json::StringField(clone, "meta") == "spring2");
  REQUIRE(json::FindField(clone, "showCup") != nullptr);

  // `meta` that points elsewhere is a shared serving pointer and stays put.
  REQUIRE(registry.CloneEntry("all", "all2", "Great League II", error));
  REQUIRE(json::StringField(registry.List().back(), "meta") == "great");

  REQUIRE_FALSE(registry.CloneEntry("spring", "spring2", "Again", error));
  REQUIRE(error.kind == ErrorKind::kAlreadyExists);
  REQUIRE_FALSE(registry.CloneEntry("winter", "winter2", "Winter", error));
  REQUIRE(error.kind == ErrorKind::kNotFound);
}

TEST_CASE("Save writes a tab-indented array that loads back in order", "[store][registry]") {
  const cupkit::tests::common::ScratchRoot scratch("cupkit-registry-save");
  const fs::path& root = scratch.Path();
  FormatsRegistry registry = LoadFixture(root);

  OpError error;
  REQUIRE(registry.Save(root / "out.json", error));
  const std::string text = cupkit::tests::common::ReadFileToString(root / "out.json");
  REQUIRE(text.rfind("[\n\t{\n\t\t\"title\": \"Great League\",", 0) == 0U);
  REQUIRE(text.back() == '\n');

  FormatsRegistry reloaded;
  REQUIRE(FormatsRegistry::Load(root / "out.json", reloaded, error));
  REQUIRE(Cups(reloaded) == Cups(registry));
}

TEST_CASE("Entry template falls back to the built-in default", "[store][registry]") {
  const cupkit::tests::common::ScratchRoot scratch("cupkit-registry-template");
  const fs::path& root = scratch.Path();

  json::Value template_entry;
  OpError error;
  REQUIRE(cupkit::store::LoadEntryTemplate(root / "formats-new.json", template_entry, error));
  const json::Value entry =
      cupkit::store::DeriveEntryFromTemplate(template_entry, "spring", "Spring Cup", 2500);
  REQUIRE(json::Serialize(entry, "") ==
          R"({"title":"Spring Cup","cup":"spring","cp":2500,"meta":"spring","showCup":true,)"
          R"("showFormat":true,"showMeta":true})");

  cupkit::tests::common::WriteFileOrFail(
      root / "formats-new.json", R"([{"title":"Custom","cup":"custom","cp":1500,"meta":"custom","hideRankings":true}])");
  REQUIRE(cupkit::store::LoadEntryTemplate(root / "formats-new.json", template_entry, error));
  REQUIRE(json::FindField(template_entry, "hideRankings") != nullptr);
}
