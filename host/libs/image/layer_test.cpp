/*
 * Copyright (C) 2023 The Android Open Source Project
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 *      http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 */

#include "host/libs/image/layer.h"

#include <sys/stat.h>
#include <unistd.h>

#include <string>

#include <android-base/file.h>
#include <android-base/strings.h>
#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "common/libs/constants/guest_layout.h"
#include "common/libs/utils/files.h"
#include "common/libs/utils/result_matchers.h"
#include "common/libs/utils/subprocess.h"

namespace microguest {
namespace {

using ::testing::HasSubstr;

constexpr char kBsdtar[] = "/usr/bin/bsdtar";

// Stands in for pip: installs one "package" named after each requirement line
// into the --target directory.
constexpr char kFakePip[] = R"(#!/bin/sh
target=""
requirements=""
while [ $# -gt 0 ]; do
  case "$1" in
    --target) target="$2"; shift ;;
    -r) requirements="$2"; shift ;;
  esac
  shift
done
while read -r package; do
  mkdir -p "$target/$package"
  echo "$package" > "$target/$package/__init__.py"
done < "$requirements"
)";

// Stands in for debootstrap: records the requested packages and lays down the
// interpreter where Debian's python3 package puts it, with an empty
// /usr/local/bin.
constexpr char kFakeDebootstrap[] = R"(#!/bin/sh
include="${2#--include=}"
target="$4"
mkdir -p "$target/etc" "$target/usr/bin" "$target/usr/local/bin" \
  "$target/usr/lib/python3/dist-packages"
echo "$include" > "$target/etc/included"
echo "$3 $5" > "$target/etc/source"
printf '#!/bin/sh\n' > "$target/usr/bin/python3.11"
chmod 0755 "$target/usr/bin/python3.11"
ln -s python3.11 "$target/usr/bin/python3"
)";

constexpr char kFailingTool[] = R"(#!/bin/sh
echo "network unreachable" >&2
exit 1
)";

std::string Contents(const std::string& path) {
  std::string contents;
  android::base::ReadFileToString(path, &contents);
  return contents;
}

class LayerTest : public ::testing::Test {
 protected:
  void SetUp() override {
    root_ = std::string(root_dir_.path);
    inputs_ = std::string(inputs_dir_.path);
    scratch_ = inputs_ + "/scratch";
    ASSERT_THAT(EnsureDirectoryExists(scratch_), IsOk());
  }

  std::string Script(const std::string& name, const char* body) {
    const auto path = inputs_ + "/" + name;
    EXPECT_TRUE(android::base::WriteStringToFile(body, path));
    EXPECT_EQ(chmod(path.c_str(), 0755), 0);
    return path;
  }

  Result<void> Apply(const LayerSpec& spec, const ToolPaths& tools = {},
                     const RuntimeLayout& runtime = {}) {
    auto layer = MG_EXPECT(CreateLayer(spec, tools, runtime));
    MG_EXPECT(layer->Apply(root_, scratch_));
    return {};
  }

  TemporaryDir root_dir_;
  TemporaryDir inputs_dir_;
  std::string root_;
  std::string inputs_;
  std::string scratch_;
};

TEST_F(LayerTest, FileLayerSetsMode) {
  const auto source = inputs_ + "/agent.py";
  ASSERT_TRUE(android::base::WriteStringToFile("print(1)\n", source));
  LayerSpec spec;
  spec.kind = LayerKind::kFile;
  spec.source = source;
  spec.destination = kPayloadPath;
  spec.mode = 0750;

  ASSERT_THAT(Apply(spec), IsOk());

  const auto placed = root_ + kPayloadPath;
  EXPECT_EQ(Contents(placed), "print(1)\n");
  struct stat st {};
  ASSERT_EQ(stat(placed.c_str(), &st), 0);
  EXPECT_EQ(st.st_mode & 07777, 0750u);
  // The host file is left where it was.
  EXPECT_TRUE(FileExists(source));
}

TEST_F(LayerTest, FileLayerRejectsDirectory) {
  LayerSpec spec;
  spec.kind = LayerKind::kFile;
  spec.source = inputs_;
  spec.destination = "/etc/file";

  EXPECT_THAT(Apply(spec), IsError());
}

TEST_F(LayerTest, DirectoryLayerAtDestination) {
  const auto data = inputs_ + "/data";
  ASSERT_THAT(EnsureDirectoryExists(data), IsOk());
  ASSERT_TRUE(
      android::base::WriteStringToFile("a,b\n", data + "/prices.csv"));
  LayerSpec spec;
  spec.kind = LayerKind::kDirectory;
  spec.source = data;
  spec.destination = kDataDirectory;

  ASSERT_THAT(Apply(spec), IsOk());

  EXPECT_EQ(Contents(root_ + kDataDirectory + "/prices.csv"), "a,b\n");
  EXPECT_TRUE(FileExists(data + "/prices.csv"));
}

TEST_F(LayerTest, PipLayerInstallsIntoSitePackages) {
  const auto requirements = inputs_ + "/requirements.txt";
  ASSERT_TRUE(
      android::base::WriteStringToFile("numpy\npandas\n", requirements));
  ToolPaths tools;
  tools.pip = Script("pip", kFakePip);
  LayerSpec spec;
  spec.kind = LayerKind::kPip;
  spec.source = requirements;

  ASSERT_THAT(Apply(spec, tools), IsOk());

  const std::string site_packages = root_ + kSitePackagesDirectory;
  EXPECT_EQ(Contents(site_packages + "/numpy/__init__.py"), "numpy\n");
  EXPECT_EQ(Contents(site_packages + "/pandas/__init__.py"), "pandas\n");
}

TEST_F(LayerTest, PipFailureCarriesToolOutput) {
  const auto requirements = inputs_ + "/requirements.txt";
  ASSERT_TRUE(android::base::WriteStringToFile("numpy\n", requirements));
  ToolPaths tools;
  tools.pip = Script("pip", kFailingTool);
  LayerSpec spec;
  spec.kind = LayerKind::kPip;
  spec.source = requirements;

  EXPECT_THAT(Apply(spec, tools),
              IsErrorAndMessage(HasSubstr("network unreachable")));
}

TEST_F(LayerTest, PackagesLayerPassesPackageList) {
  ToolPaths tools;
  tools.debootstrap = Script("debootstrap", kFakeDebootstrap);
  LayerSpec spec;
  spec.kind = LayerKind::kPackages;
  spec.packages = {"python3", "ca-certificates"};

  ASSERT_THAT(Apply(spec, tools), IsOk());

  EXPECT_EQ(Contents(root_ + "/etc/included"), "python3,ca-certificates\n");
  EXPECT_EQ(Contents(root_ + "/etc/source"),
            "bookworm http://deb.debian.org/debian\n");
  EXPECT_TRUE(FileExists(root_ + kDebianPythonInterpreter));
  EXPECT_FALSE(FileExists(root_ + kPayloadInterpreter));
}

TEST_F(LayerTest, PipLayerFollowsRuntimeLayout) {
  const auto requirements = inputs_ + "/requirements.txt";
  ASSERT_TRUE(android::base::WriteStringToFile("numpy\n", requirements));
  ToolPaths tools;
  tools.pip = Script("pip", kFakePip);
  LayerSpec spec;
  spec.kind = LayerKind::kPip;
  spec.source = requirements;

  ASSERT_THAT(Apply(spec, tools, DebianRuntimeLayout()), IsOk());

  EXPECT_EQ(Contents(root_ + kDebianSitePackagesDirectory +
                     "/numpy/__init__.py"),
            "numpy\n");
  EXPECT_FALSE(FileExists(root_ + kSitePackagesDirectory));
}

TEST_F(LayerTest, ArchiveLayerExtractsOverTree) {
  if (!FileExists(kBsdtar)) {
    GTEST_SKIP() << kBsdtar << " is not installed";
  }
  const auto content = inputs_ + "/content";
  ASSERT_THAT(EnsureDirectoryExists(content + "/opt/app"), IsOk());
  ASSERT_TRUE(android::base::WriteStringToFile("v2", content + "/opt/app/v"));
  const auto archive = inputs_ + "/layer.tar";
  Command create(kBsdtar);
  create.AddParameter("-cf");
  create.AddParameter(archive);
  create.AddParameter("-C");
  create.AddParameter(content);
  create.AddParameter(".");
  ASSERT_THAT(RunAndLogOutput(std::move(create)), IsOk());
  ASSERT_THAT(EnsureDirectoryExists(root_ + "/opt/app"), IsOk());
  ASSERT_TRUE(android::base::WriteStringToFile("v1", root_ + "/opt/app/v"));
  ASSERT_TRUE(android::base::WriteStringToFile("keep", root_ + "/opt/app/k"));
  ToolPaths tools;
  tools.bsdtar = kBsdtar;
  LayerSpec spec;
  spec.kind = LayerKind::kArchive;
  spec.source = archive;

  ASSERT_THAT(Apply(spec, tools), IsOk());

  EXPECT_EQ(Contents(root_ + "/opt/app/v"), "v2");
  EXPECT_EQ(Contents(root_ + "/opt/app/k"), "keep");
}

TEST_F(LayerTest, MissingArchiveIsAnError) {
  LayerSpec spec;
  spec.kind = LayerKind::kArchive;
  spec.source = inputs_ + "/missing.tar";

  EXPECT_THAT(Apply(spec), IsErrorAndMessage(HasSubstr("missing.tar")));
}

}  // namespace
}  // namespace microguest
