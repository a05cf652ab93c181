#include "psdconv/external-rasterizer.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <filesystem>
#include <stdexcept>
#include <string>

#include "psdconv/temp-dir.hpp"

namespace psdconv {

using namespace std::chrono_literals;

namespace {

// Stands in for 'convert': copies the input (without the frame selector) to the output.
constexpr std::string_view kCopyScript = R"(in="${1%\[0\]}"
cp "$in" "$2"
)";

}  // namespace

TEST(ExternalRasterizer, EmptyProgramThrows) { EXPECT_THROW(ExternalRasterizer(""), std::invalid_argument); }

TEST(ExternalRasterizer, Success) {
  test::ScopedTempDir dir;
  const auto script = test::WriteShellScript(dir, "convert-ok.sh", kCopyScript);
  const auto input = dir.writeFile("in.psd", "layered");
  const auto output = dir.dirPath() / "out.png";

  ExternalRasterizer rasterizer(script.string());
  EXPECT_EQ(rasterizer.program(), script.string());
  EXPECT_TRUE(rasterizer.rasterize(input, output, 5s));
  EXPECT_EQ(test::ReadFile(output), "layered");
}

TEST(ExternalRasterizer, ReceivesFrameSelector) {
  test::ScopedTempDir dir;
  const auto script = test::WriteShellScript(dir, "convert-args.sh", R"(printf '%s|%s' "$1" "$2" > "$2")");
  const auto input = dir.writeFile("in.psd", "x");
  const auto output = dir.dirPath() / "out.png";

  ExternalRasterizer rasterizer(script.string());
  ASSERT_TRUE(rasterizer.rasterize(input, output, 5s));
  EXPECT_EQ(test::ReadFile(output), input.string() + "[0]|" + output.string());
}

TEST(ExternalRasterizer, NonZeroExit) {
  test::ScopedTempDir dir;
  const auto script = test::WriteShellScript(dir, "convert-ko.sh", "echo 'corrupt image' 1>&2\nexit 1\n");
  const auto input = dir.writeFile("in.psd", "x");

  ExternalRasterizer rasterizer(script.string());
  EXPECT_FALSE(rasterizer.rasterize(input, dir.dirPath() / "out.png", 5s));
}

TEST(ExternalRasterizer, KilledBySignal) {
  test::ScopedTempDir dir;
  const auto script = test::WriteShellScript(dir, "convert-crash.sh", "kill -SEGV $$\n");
  const auto input = dir.writeFile("in.psd", "x");

  ExternalRasterizer rasterizer(script.string());
  EXPECT_FALSE(rasterizer.rasterize(input, dir.dirPath() / "out.png", 5s));
}

TEST(ExternalRasterizer, Timeout) {
  test::ScopedTempDir dir;
  const auto script = test::WriteShellScript(dir, "convert-hang.sh", "sleep 30\n");
  const auto input = dir.writeFile("in.psd", "x");

  ExternalRasterizer rasterizer(script.string());
  const auto start = std::chrono::steady_clock::now();
  EXPECT_FALSE(rasterizer.rasterize(input, dir.dirPath() / "out.png", 200ms));
  EXPECT_LT(std::chrono::steady_clock::now() - start, 10s);
}

TEST(ExternalRasterizer, MissingProgram) {
  test::ScopedTempDir dir;
  const auto input = dir.writeFile("in.psd", "x");

  ExternalRasterizer rasterizer((dir.dirPath() / "does-not-exist").string());
  EXPECT_FALSE(rasterizer.rasterize(input, dir.dirPath() / "out.png", 1s));
  EXPECT_FALSE(std::filesystem::exists(dir.dirPath() / "out.png"));
}

}  // namespace psdconv
