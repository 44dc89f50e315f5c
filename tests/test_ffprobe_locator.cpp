#include "probedock/ffprobe_locator.hpp"

#include <QCoreApplication>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QTemporaryDir>

#include <gtest/gtest.h>

using probedock::FfprobeLocator;
using probedock::Location;
using probedock::ProbeError;

namespace {

FfprobeLocator locatorIn(const QTemporaryDir& dir) {
    FfprobeLocator::Options options;
    options.hostExecutable = dir.filePath("host_app");
    return FfprobeLocator(options);
}

void touch(const QString& path) {
    QFile file(path);
    ASSERT_TRUE(file.open(QIODevice::WriteOnly));
    file.write("not really ffprobe");
}

}  // namespace

TEST(FfprobeLocatorTest, SidecarFileNameFollowsPlatformConvention) {
    const QFileInfo name(FfprobeLocator::sidecarFileName("ffprobe"));
    EXPECT_EQ(name.completeBaseName(), "ffprobe");
#ifdef _WIN32
    EXPECT_EQ(name.fileName(), "ffprobe.exe");
    EXPECT_EQ(name.suffix(), "exe");
#else
    EXPECT_EQ(name.fileName(), "ffprobe");
    EXPECT_TRUE(name.suffix().isEmpty());
#endif
}

TEST(FfprobeLocatorTest, SidecarPathSitsNextToRunningExecutable) {
    const FfprobeLocator locator;
    const auto sidecar = locator.sidecarPath();
    ASSERT_TRUE(sidecar.ok()) << sidecar.errorString.toStdString();

    const QFileInfo info(sidecar.path);
    const QFileInfo exe(QCoreApplication::applicationFilePath());
    EXPECT_EQ(info.absolutePath(), exe.absolutePath());
    EXPECT_EQ(info.fileName(), FfprobeLocator::sidecarFileName("ffprobe"));
}

TEST(FfprobeLocatorTest, SidecarPathHonoursHostExecutableOverride) {
    QTemporaryDir dir;
    ASSERT_TRUE(dir.isValid());

    const auto sidecar = locatorIn(dir).sidecarPath();
    ASSERT_TRUE(sidecar.ok());
    EXPECT_EQ(QFileInfo(sidecar.path).absoluteFilePath(),
              QFileInfo(dir.filePath(FfprobeLocator::sidecarFileName("ffprobe"))).absoluteFilePath());
}

TEST(FfprobeLocatorTest, RootPathHasNoParentDirectory) {
    FfprobeLocator::Options options;
    options.hostExecutable = "/";
    const auto sidecar = FfprobeLocator(options).sidecarPath();
    EXPECT_FALSE(sidecar.ok());
    EXPECT_EQ(sidecar.error, ProbeError::NoParentDirectory);
    EXPECT_FALSE(sidecar.errorString.isEmpty());
}

TEST(FfprobeLocatorTest, FallsBackToBareNameWhenSidecarMissing) {
    QTemporaryDir dir;
    ASSERT_TRUE(dir.isValid());

    const Location location = locatorIn(dir).locate();
    EXPECT_EQ(location.source, Location::Source::SystemSearch);
    EXPECT_FALSE(location.isSidecar());
    EXPECT_EQ(location.path, "ffprobe");
}

TEST(FfprobeLocatorTest, FallsBackToBareNameWhenSidecarResolutionFails) {
    FfprobeLocator::Options options;
    options.hostExecutable = "/";
    const FfprobeLocator locator(options);

    const Location location = locator.locate();
    EXPECT_EQ(location.source, Location::Source::SystemSearch);
    EXPECT_EQ(location.path, "ffprobe");
    EXPECT_EQ(locator.effectivePath(), "ffprobe");
}

TEST(FfprobeLocatorTest, PrefersExistingSidecar) {
    QTemporaryDir dir;
    ASSERT_TRUE(dir.isValid());
    const FfprobeLocator locator = locatorIn(dir);
    const QString expected = locator.sidecarPath().path;
    touch(expected);

    const Location location = locator.locate();
    EXPECT_EQ(location.source, Location::Source::Sidecar);
    EXPECT_EQ(location.path, expected);
    EXPECT_EQ(locator.effectivePath(), expected);
}

TEST(FfprobeLocatorTest, RecomputesOnEveryQuery) {
    QTemporaryDir dir;
    ASSERT_TRUE(dir.isValid());
    const FfprobeLocator locator = locatorIn(dir);

    EXPECT_FALSE(locator.locate().isSidecar());
    touch(locator.sidecarPath().path);
    EXPECT_TRUE(locator.locate().isSidecar());
    ASSERT_TRUE(QFile::remove(locator.sidecarPath().path));
    EXPECT_FALSE(locator.locate().isSidecar());
}

TEST(FfprobeLocatorTest, CustomBinaryNameIsUsedForBothVariants) {
    QTemporaryDir dir;
    ASSERT_TRUE(dir.isValid());
    FfprobeLocator::Options options;
    options.binaryName = "ffprobe-6";
    options.hostExecutable = dir.filePath("host_app");
    const FfprobeLocator locator(options);

    EXPECT_EQ(locator.locate().path, "ffprobe-6");
    touch(locator.sidecarPath().path);
    EXPECT_EQ(QFileInfo(locator.locate().path).fileName(), FfprobeLocator::sidecarFileName("ffprobe-6"));
}

TEST(FfprobeLocatorTest, TrailingSeparatorStillHasParent) {
    FfprobeLocator::Options options;
    options.hostExecutable = "/opt/app/";
    const auto sidecar = FfprobeLocator(options).sidecarPath();
    ASSERT_TRUE(sidecar.ok()) << sidecar.errorString.toStdString();
    EXPECT_EQ(QFileInfo(sidecar.path).fileName(), FfprobeLocator::sidecarFileName("ffprobe"));
    EXPECT_EQ(QFileInfo(QFileInfo(sidecar.path).absolutePath()).fileName(), "opt");
}
