#include "output/unified.hpp"
#include "parser/patch_parser.hpp"

#include <doctest.h>

#include <string>

using namespace patchy;

TEST_CASE("unified_patch_render") {
    SUBCASE("headers_and_hunks") {
        Patch patch;
        patch.old_file = {"a/f.txt", std::string{"2021-01-01"}};
        patch.new_file = {"b/f.txt", std::nullopt};

        Hunk hunk;
        hunk.old_range = {3, 1};
        hunk.new_range = {3, 2};
        hunk.range_hint = "void f()";
        hunk.lines = {Line::Context("x"), Line::Add("y")};
        patch.hunks.push_back(hunk);

        auto lines = unified_patch_render(patch);
        REQUIRE(lines.size() == 5);
        REQUIRE(lines[0] == "--- a/f.txt\t2021-01-01\n");
        REQUIRE(lines[1] == "+++ b/f.txt\n");
        REQUIRE(lines[2] == "@@ -3 +3,2 @@ void f()\n");
        REQUIRE(lines[3] == " x\n");
        REQUIRE(lines[4] == "+y\n");
    }

    SUBCASE("no_newline_marker") {
        Patch patch;
        patch.old_file.path = "a";
        patch.new_file.path = "b";
        patch.end_newline = false;

        Hunk hunk;
        hunk.old_range = {1, 1};
        hunk.new_range = {1, 1};
        hunk.lines = {Line::Remove("x"), Line::Add("y")};
        patch.hunks.push_back(hunk);

        REQUIRE(unified_patch_text(patch) == "--- a\n+++ b\n@@ -1 +1 @@\n-x\n+y\n\\ No newline at end of file\n");
    }

    SUBCASE("parsed_patch_renders_back") {
        std::string s = R"(--- old.txt
+++ new.txt
@@ -1,4 +1,2 @@
 A
-B
-C
 D
)";
        Patch patch;
        PatchParseResult result;
        REQUIRE(patch_parse(s, patch, result));
        REQUIRE(unified_patch_text(patch) == s);
    }
}
