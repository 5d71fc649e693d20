#include "test_common.hpp"

#include <string>
#include <vector>

using namespace valex;

static const char* kSchema = R"(
tokens: 3
schema:
  type: object
  additionalProperties: false
  properties:
    all_models:
      type: array
      items:
        type: object
        additionalProperties: false
        properties:
          maker:
            type: string
          model_name:
            type: string
        required:
          - maker
          - model_name
  required:
    - all_models
)";

static int count_key(ordered_node& root, const std::string& name) {
  int count = 0;
  const bool completed = walk(root, [&](ordered_node&, const std::string& key) {
    if (key == name) ++count;
    return true;
  });
  VALEX_CHECK(completed);
  return count;
}

static void test_stop_is_global() {
  ordered_node root = valex_test::doc(kSchema);
  VALEX_CHECK(count_key(root, "additionalProperties") == 2);

  const bool completed = walk(root, [](ordered_node& map, const std::string& key) {
    if (key == "type") {
      const ordered_node* type = find(map, key);
      if (type && type->is_string() && type->as_str() == "object") {
        if (contains(map, "additionalProperties")) remove<ordered_node>(map, "additionalProperties");
        return false;
      }
    }
    return true;
  });

  VALEX_CHECK(!completed);
  VALEX_CHECK(count_key(root, "additionalProperties") == 1);
  VALEX_CHECK(!contains(root, "/schema/additionalProperties"));
  VALEX_CHECK(contains(root, "/schema/properties/all_models/items/additionalProperties"));
}

static void test_breadth_first_order() {
  ordered_node root = valex_test::doc(R"(
a:
  c:
    e: 1
  d: 2
b:
  - f: 3
  -
    - g: 4
)");

  std::vector<std::string> seen;
  VALEX_CHECK(walk(root, [&](ordered_node&, const std::string& key) {
    seen.push_back(key);
    return true;
  }));

  // Array elements are never reported themselves, but objects inside them are.
  const std::vector<std::string> expected = {"a", "b", "c", "d", "e", "f", "g"};
  VALEX_CHECK(seen == expected);
}

static void test_snapshot_and_edits() {
  ordered_node root = valex_test::doc(R"(
first: 1
second:
  inner: 2
third: 3
)");

  // Keys removed mid-visit are still reported (the list was taken up front),
  // keys added mid-visit are not, but added children are descended into.
  std::vector<std::string> seen;
  walk(root, [&](ordered_node& map, const std::string& key) {
    seen.push_back(key);
    if (key == "first") {
      remove<ordered_node>(map, "second");
      insert(map, "added", valex_test::doc("deep: 5\n"));
    }
    return true;
  });

  const std::vector<std::string> expected = {"first", "second", "third", "deep"};
  VALEX_CHECK(seen == expected);
  VALEX_CHECK(!contains(root, "second"));
  VALEX_CHECK(get<int>(root, "/added/deep") == 5);
}

static void test_scalar_root() {
  ordered_node root = valex_test::doc("just text\n");
  int calls = 0;
  VALEX_CHECK(walk(root, [&](ordered_node&, const std::string&) {
    ++calls;
    return true;
  }));
  VALEX_CHECK(calls == 0);
}

void test_walk() {
  test_stop_is_global();
  test_breadth_first_order();
  test_snapshot_and_edits();
  test_scalar_root();
}
