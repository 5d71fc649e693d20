#include "test_common.hpp"

#include <cstdint>
#include <optional>
#include <string_view>
#include <vector>

using namespace valex;

static void test_scalars() {
  const ordered_node d = valex_test::doc(R"(
s: hello
i: 42
neg: -7
f: 1.5
t: true
n: null
)");

  {
    std::string_view s = get_as<std::string_view>(d, "s");
    VALEX_CHECK(s == "hello");
    // Borrowed straight out of the tree.
    VALEX_CHECK(s.data() == locate(d, "s").as_str().data());
  }
  VALEX_CHECK(get_as<std::int64_t>(d, "i") == 42);
  VALEX_CHECK(get_as<std::int32_t>(d, "neg") == -7);
  VALEX_CHECK(get_as<std::uint32_t>(d, "i") == 42u);
  VALEX_CHECK(get_as<double>(d, "f") == 1.5);
  VALEX_CHECK(get_as<double>(d, "i") == 42.0);
  VALEX_CHECK(get_as<bool>(d, "t"));

  VALEX_EXPECT_ERROR(get_as<std::int64_t>(d, "f"), ErrorKind::PropertyValueNotOfType);
  VALEX_EXPECT_ERROR(get_as<std::uint32_t>(d, "neg"), ErrorKind::PropertyValueNotOfType);
  VALEX_EXPECT_ERROR(get_as<bool>(d, "i"), ErrorKind::PropertyValueNotOfType);
  VALEX_EXPECT_ERROR(get_as<std::string_view>(d, "n"), ErrorKind::PropertyValueNotOfType);
  VALEX_EXPECT_ERROR(get_as<double>(d, "s"), ErrorKind::PropertyValueNotOfType);
}

static void test_integer_ranges() {
  const ordered_node d = valex_test::doc(R"(
two_pow_32: 4294967296
u32_max: 4294967295
i32_max: 2147483647
i32_over: 2147483648
i32_min: -2147483648
i32_under: -2147483649
)");

  // 2^32 must not wrap to 0.
  VALEX_EXPECT_ERROR(as<std::uint32_t>(locate(d, "two_pow_32")), ErrorKind::ValueNotOfType);
  VALEX_EXPECT_ERROR(get_as<std::uint32_t>(d, "two_pow_32"), ErrorKind::PropertyValueNotOfType);
  VALEX_CHECK(get_as<std::uint32_t>(d, "u32_max") == 4294967295u);
  VALEX_CHECK(get_as<std::int64_t>(d, "two_pow_32") == 4294967296);

  VALEX_CHECK(get_as<std::int32_t>(d, "i32_max") == 2147483647);
  VALEX_CHECK(get_as<std::int32_t>(d, "i32_min") == -2147483647 - 1);
  VALEX_EXPECT_ERROR(get_as<std::int32_t>(d, "i32_over"), ErrorKind::PropertyValueNotOfType);
  VALEX_EXPECT_ERROR(get_as<std::int32_t>(d, "i32_under"), ErrorKind::PropertyValueNotOfType);
}

static void test_arrays() {
  const ordered_node d = valex_test::doc(R"(
words:
  - hello
  - world
objects:
  - a: 1
  - b: 2
mixed:
  - hello
  - 3
)");

  {
    const std::vector<std::string_view> words = as<std::vector<std::string_view>>(locate(d, "words"));
    VALEX_CHECK(words.size() == 2);
    VALEX_CHECK(words[0] == "hello");
    VALEX_CHECK(words[1] == "world");
  }
  {
    const node_array& objects = as<node_array_ref>(locate(d, "objects"));
    VALEX_CHECK(objects.size() == 2);
    VALEX_CHECK(get_as<std::int64_t>(objects[0], "a") == 1);
    VALEX_CHECK(&objects == &locate(d, "objects").as_seq());
  }
  {
    const node_array& via_path = get_as<node_array_ref>(d, "/mixed");
    VALEX_CHECK(via_path.size() == 2);
  }

  // One non-string element fails the whole conversion.
  VALEX_EXPECT_ERROR(get_as<std::vector<std::string_view>>(d, "mixed"), ErrorKind::PropertyValueNotOfType);
  VALEX_EXPECT_ERROR(as<node_array_ref>(locate(d, "/words/0")), ErrorKind::ValueNotOfType);
}

static void test_optional_targets() {
  const ordered_node d = valex_test::doc(R"(
s: hello
i: 4294967296
)");

  {
    const std::optional<std::string_view> s = get_as<std::optional<std::string_view>>(d, "s");
    VALEX_CHECK(s && *s == "hello");
  }
  {
    // Mismatch is absorbed, not reported.
    const std::optional<std::string_view> s = get_as<std::optional<std::string_view>>(d, "i");
    VALEX_CHECK(!s);
    const std::optional<std::uint32_t> u = as<std::optional<std::uint32_t>>(locate(d, "i"));
    VALEX_CHECK(!u);
    const std::optional<bool> b = as<std::optional<bool>>(locate(d, "s"));
    VALEX_CHECK(!b);
  }
  // A missing path is still an error.
  VALEX_EXPECT_ERROR(get_as<std::optional<bool>>(d, "missing"), ErrorKind::PropertyNotFound);
}

void test_coercion() {
  test_scalars();
  test_integer_ranges();
  test_arrays();
  test_optional_targets();
}
