#include "parser/patch_parser.hpp"

#include <doctest.h>

#include <string>
#include <vector>

using namespace patchy;

TEST_CASE("patch_parse") {
    SUBCASE("single_hunk") {
        std::string s = R"(--- old.txt	2021-03-04 10:00:00.000000000 +0100
+++ new.txt	2021-03-05 11:00:00.000000000 +0100
@@ -1,3 +1,3 @@ int main()
 line 1
-line 2
+new line 2
 line 3
)";
        Patch patch;
        PatchParseResult result;
        REQUIRE(patch_parse(s, patch, result));
        REQUIRE(result.is_ok());

        REQUIRE(patch.old_file.path == "old.txt");
        REQUIRE(patch.old_file.meta);
        REQUIRE(*patch.old_file.meta == "2021-03-04 10:00:00.000000000 +0100");
        REQUIRE(patch.new_file.path == "new.txt");
        REQUIRE(patch.end_newline);

        REQUIRE(patch.hunks.size() == 1);
        const auto& hunk = patch.hunks[0];
        REQUIRE(hunk.old_range.start == 1);
        REQUIRE(hunk.old_range.count == 3);
        REQUIRE(hunk.new_range.start == 1);
        REQUIRE(hunk.new_range.count == 3);
        REQUIRE(hunk.range_hint == "int main()");

        REQUIRE(hunk.lines.size() == 4);
        REQUIRE(hunk.lines[0] == Line::Context("line 1"));
        REQUIRE(hunk.lines[1] == Line::Remove("line 2"));
        REQUIRE(hunk.lines[2] == Line::Add("new line 2"));
        REQUIRE(hunk.lines[3] == Line::Context("line 3"));

        REQUIRE(hunk_old_lines(hunk) == std::vector<std::string>{"line 1", "line 2", "line 3"});
        REQUIRE(hunk_new_lines(hunk) == std::vector<std::string>{"line 1", "new line 2", "line 3"});
    }

    SUBCASE("git_preamble_and_implicit_counts") {
        std::string s = R"(diff --git a/src/x.c b/src/x.c
index 1234567..abcdefg 100644
--- a/src/x.c
+++ b/src/x.c
@@ -4 +4 @@
-old
+new
)";
        Patch patch;
        PatchParseResult result;
        REQUIRE(patch_parse(s, patch, result));
        REQUIRE(patch.old_file.path == "a/src/x.c");
        REQUIRE_FALSE(patch.old_file.meta);
        REQUIRE(patch.new_file.path == "b/src/x.c");
        REQUIRE(patch.hunks.size() == 1);
        REQUIRE(patch.hunks[0].old_range.start == 4);
        REQUIRE(patch.hunks[0].old_range.count == 1);
        REQUIRE(patch.hunks[0].new_range.count == 1);
        REQUIRE(patch.hunks[0].range_hint.empty());
    }

    SUBCASE("body_lines_that_look_like_headers") {
        std::string s = R"(--- a.txt
+++ a.txt
@@ -1,2 +1,2 @@
--- x
+++ y
 keep
)";
        Patch patch;
        PatchParseResult result;
        REQUIRE(patch_parse(s, patch, result));
        REQUIRE(patch.hunks[0].lines.size() == 3);
        REQUIRE(patch.hunks[0].lines[0] == Line::Remove("-- x"));
        REQUIRE(patch.hunks[0].lines[1] == Line::Add("++ y"));
    }

    SUBCASE("empty_line_is_context") {
        std::string s = "--- a\n+++ b\n@@ -1,3 +1,2 @@\n a\n\n-c\n";
        Patch patch;
        PatchParseResult result;
        REQUIRE(patch_parse(s, patch, result));
        REQUIRE(patch.hunks[0].lines.size() == 3);
        REQUIRE(patch.hunks[0].lines[1] == Line::Context(""));
    }

    SUBCASE("no_newline_marker_on_removed_line") {
        std::string s = R"(--- a
+++ b
@@ -1 +1 @@
-x
\ No newline at end of file
+x
)";
        Patch patch;
        PatchParseResult result;
        REQUIRE(patch_parse(s, patch, result));
        REQUIRE(patch.end_newline);
        REQUIRE(patch.hunks[0].lines.size() == 2);
    }

    SUBCASE("no_newline_marker_on_new_side") {
        std::string s = R"(--- a
+++ b
@@ -1 +1 @@
-x
+y
\ No newline at end of file
)";
        Patch patch;
        PatchParseResult result;
        REQUIRE(patch_parse(s, patch, result));
        REQUIRE_FALSE(patch.end_newline);
    }

    SUBCASE("largest_line_number") {
        std::string s = "--- a\n+++ b\n@@ -9223372036854775807,0 +1,0 @@\n";
        Patch patch;
        PatchParseResult result;
        REQUIRE(patch_parse(s, patch, result));
        REQUIRE(patch.hunks[0].old_range.start == 9223372036854775807LL);
    }

    SUBCASE("multiple_hunks") {
        std::string s = R"(--- a
+++ b
@@ -1,2 +1,1 @@
 a
-b
@@ -10,1 +9,2 @@
 j
+k
)";
        Patch patch;
        PatchParseResult result;
        REQUIRE(patch_parse(s, patch, result));
        REQUIRE(patch.hunks.size() == 2);
        REQUIRE(patch.hunks[1].old_range.start == 10);
        REQUIRE(patch.hunks[1].new_range.start == 9);
        REQUIRE(patch.hunks[1].lines.size() == 2);
    }

    SUBCASE("errors") {
        Patch patch;
        PatchParseResult result;

        REQUIRE_FALSE(patch_parse("just some text\n", patch, result));
        REQUIRE(result.error == "no patch found");

        REQUIRE_FALSE(patch_parse("--- a\n@@ -1 +1 @@\n", patch, result));
        REQUIRE(result.line_number == 2);

        REQUIRE_FALSE(patch_parse("--- a\n+++ b\n@@ -x +1 @@\n", patch, result));
        REQUIRE(result.line_number == 3);

        REQUIRE_FALSE(patch_parse("--- a\n+++ b\n@@ -99999999999999999999 +1 @@\n-a\n+b\n", patch, result));
        REQUIRE(result.line_number == 3);
        REQUIRE(result.error == "malformed hunk header: '@@ -99999999999999999999 +1 @@'");

        REQUIRE_FALSE(patch_parse("--- a\n+++ b\n@@ -1 +1,9223372036854775808 @@\n-a\n+b\n", patch, result));
        REQUIRE(result.line_number == 3);

        REQUIRE_FALSE(patch_parse("--- a\n+++ b\n@@ -1,3 +1,3 @@\n a\n", patch, result));
        REQUIRE(result.error == "unexpected end of patch inside hunk");

        REQUIRE_FALSE(patch_parse("--- a\n+++ b\n@@ -1,2 +1,2 @@\n a\n*b\n", patch, result));
        REQUIRE(result.line_number == 5);

        REQUIRE_FALSE(patch_parse("--- a\n+++ b\n@@ -1 +1,2 @@\n-a\n-b\n", patch, result));
        REQUIRE(result.line_number == 5);

        REQUIRE_FALSE(patch_parse("--- a\n+++ b\n", patch, result));
        REQUIRE(result.error == "file patch has no hunks");

        REQUIRE_FALSE(patch_parse("@@ -1 +1 @@\n-a\n+b\n", patch, result));
        REQUIRE(result.line_number == 1);
    }
}

TEST_CASE("patch_parse_multiple") {
    std::string s = R"(diff --git a/one.txt b/one.txt
--- a/one.txt
+++ b/one.txt
@@ -1 +1 @@
-1
+one
diff --git a/two.txt b/two.txt
--- a/two.txt
+++ b/two.txt
@@ -1,2 +1,3 @@
 2
+two
 2
)";

    SUBCASE("all") {
        std::vector<Patch> patches;
        PatchParseResult result;
        REQUIRE(patch_parse_multiple(s, patches, result));
        REQUIRE(patches.size() == 2);
        REQUIRE(patches[0].new_file.path == "b/one.txt");
        REQUIRE(patches[1].new_file.path == "b/two.txt");
        REQUIRE(patches[1].hunks[0].lines.size() == 3);
    }

    SUBCASE("single_rejects_multiple") {
        Patch patch;
        PatchParseResult result;
        REQUIRE_FALSE(patch_parse(s, patch, result));
        REQUIRE(result.error == "expected a single file patch, found 2");
    }
}
