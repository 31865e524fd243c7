#include <gtest/gtest.h>
#include "platform/platform_abstraction.h"
#include "api/install_layout.h"
#include <cstdint>
#include <filesystem>

using namespace cubeprog;
using namespace cubeprog::platform;

namespace {

/**
 * @brief Loader that hands out fake handles and counts unloads
 */
class RecordingLoader : public IDynamicLoader {
public:
    int loads = 0;
    int unloads = 0;

    LibraryHandle load(const std::string& path) override {
        if (path == "missing.so") {
            throw DynamicLoaderException("Failed to load library 'missing.so'");
        }
        ++loads;
        return reinterpret_cast<LibraryHandle>(static_cast<uintptr_t>(0x1000 + loads));
    }

    void unload(LibraryHandle handle) override {
        (void)handle;
        ++unloads;
    }

    void* getSymbol(LibraryHandle handle, const std::string& symbolName) override {
        (void)handle;
        return symbolName == "reset" ? reinterpret_cast<void*>(&marker) : nullptr;
    }

    std::string getLastError() const override { return "recorded"; }

    Platform getPlatform() const override { return Platform::LINUX; }

    static int marker;
};

int RecordingLoader::marker = 0;

} // anonymous namespace

class PlatformAbstractionTest : public ::testing::Test {
protected:
    void SetUp() override {
        platform = std::make_unique<PlatformAbstraction>();
    }

    void TearDown() override {
        platform.reset();
    }

    std::unique_ptr<PlatformAbstraction> platform;
};

// ============================================================================
// Construction and Initialization Tests
// ============================================================================

TEST_F(PlatformAbstractionTest, PlatformDetection) {
    EXPECT_EQ(platform->getPlatform(), Platform::LINUX);
    EXPECT_STREQ(platform->getLibraryExtension(), ".so");
    EXPECT_STREQ(platform->getLibraryPrefix(), "lib");
}

TEST(PlatformAbstractionInjectionTest, NullLoaderRejected) {
    std::unique_ptr<IDynamicLoader> noLoader;
    EXPECT_THROW(PlatformAbstraction platform(std::move(noLoader)), std::invalid_argument);
}

// ============================================================================
// Library Loading Tests
// ============================================================================

TEST_F(PlatformAbstractionTest, LoadTracksLibrary) {
    LibraryHandle handle = platform->loadLibrary("libc.so.6");
    ASSERT_NE(handle, INVALID_LIBRARY_HANDLE);

    EXPECT_TRUE(platform->isLibraryLoaded(handle));
    EXPECT_EQ(platform->getLibraryPath(handle), "libc.so.6");
    EXPECT_EQ(platform->getLoadedLibraryCount(), 1u);

    using AbsFn = int (*)(int);
    auto absFn = platform->getSymbol<AbsFn>(handle, "abs");
    ASSERT_NE(absFn, nullptr);
    EXPECT_EQ(absFn(-7), 7);

    platform->unloadLibrary(handle);
    EXPECT_FALSE(platform->isLibraryLoaded(handle));
    EXPECT_EQ(platform->getLoadedLibraryCount(), 0u);
}

TEST_F(PlatformAbstractionTest, UnknownHandlePath) {
    LibraryHandle fakeHandle = reinterpret_cast<LibraryHandle>(0x42);
    EXPECT_THROW(platform->getLibraryPath(fakeHandle), std::out_of_range);
}

TEST(PlatformAbstractionInjectionTest, DelegatesToInjectedLoader) {
    auto loader = std::make_unique<RecordingLoader>();
    RecordingLoader* raw = loader.get();
    PlatformAbstraction platform(std::move(loader));

    LibraryHandle handle = platform.loadLibrary("libCubeProgrammer_API.so");
    EXPECT_EQ(raw->loads, 1);
    EXPECT_NE(platform.getSymbol(handle, "reset"), nullptr);
    EXPECT_EQ(platform.getSymbol(handle, "startFus"), nullptr);
    EXPECT_EQ(platform.getLastError(), "recorded");

    platform.unloadLibrary(handle);
    EXPECT_EQ(raw->unloads, 1);
}

TEST(PlatformAbstractionInjectionTest, FailedLoadIsNotTracked) {
    PlatformAbstraction platform(std::make_unique<RecordingLoader>());

    EXPECT_THROW(platform.loadLibrary("missing.so"), DynamicLoaderException);
    EXPECT_EQ(platform.getLoadedLibraryCount(), 0u);
}

// ============================================================================
// Installation Layout Tests
// ============================================================================

TEST(InstallLayoutTest, LibraryFileNames) {
    EXPECT_STREQ(apiLibraryFileName(Platform::LINUX), "libCubeProgrammer_API.so");
    EXPECT_STREQ(apiLibraryFileName(Platform::WINDOWS), "CubeProgrammer_API.dll");
    EXPECT_THROW(apiLibraryFileName(Platform::MACOS), std::runtime_error);
    EXPECT_THROW(apiLibraryFileName(Platform::UNKNOWN), std::runtime_error);
}

TEST(InstallLayoutTest, LinuxLayout) {
    InstallLayout layout = InstallLayout::fromInstallDir("/opt/st/STM32CubeProgrammer", Platform::LINUX);

    EXPECT_EQ(layout.installDir, "/opt/st/STM32CubeProgrammer");
    EXPECT_EQ(layout.libraryPath, "/opt/st/STM32CubeProgrammer/api/lib/libCubeProgrammer_API.so");
    EXPECT_EQ(layout.loadersPath, "/opt/st/STM32CubeProgrammer/bin");
}

TEST(InstallLayoutTest, RelativeDirectoryIsMadeAbsolute) {
    InstallLayout layout = InstallLayout::fromInstallDir("st/../cubeprogrammer", Platform::LINUX);

    std::filesystem::path expected = (std::filesystem::current_path() / "cubeprogrammer").lexically_normal();
    EXPECT_EQ(layout.installDir, expected.string());
    EXPECT_TRUE(std::filesystem::path(layout.libraryPath).is_absolute());
    EXPECT_EQ(layout.loadersPath, (expected / "bin").string());
}

TEST(InstallLayoutTest, UnsupportedPlatformThrows) {
    EXPECT_THROW(InstallLayout::fromInstallDir("/opt/st", Platform::MACOS), std::runtime_error);
}
