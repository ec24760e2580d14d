#include <gtest/gtest.h>
#include <transfer/validators.hpp>
#include <core/constants.hpp>

TEST(ValidatePath, AcceptsOrdinaryPaths) {
    EXPECT_TRUE(validate_path("/root/file.txt", "container path").is_ok());
    EXPECT_TRUE(validate_path("relative/dir/file", "local path").is_ok());
    EXPECT_TRUE(validate_path("/tmp/with space/x", "host path").is_ok());
}

TEST(ValidatePath, RejectsEmptyAndBlank) {
    auto r = validate_path("", "container path");
    EXPECT_EQ(r.kind, ErrorKind::PathInvalid);
    EXPECT_NE(r.error.find("container path"), std::string::npos);
    EXPECT_EQ(validate_path("   \t", "local path").kind, ErrorKind::PathInvalid);
}

TEST(ValidatePath, RejectsDotDotAnywhere) {
    EXPECT_EQ(validate_path("/root/../etc/shadow", "container path").kind, ErrorKind::PathInvalid);
    EXPECT_EQ(validate_path("../x", "local path").kind, ErrorKind::PathInvalid);
    EXPECT_EQ(validate_path("/data/file..bak", "host path").kind, ErrorKind::PathInvalid);
}

TEST(ValidatePath, RejectsNulByte) {
    std::string p("/root/a");
    p.push_back('\0');
    p += "b";
    EXPECT_EQ(validate_path(p, "container path").kind, ErrorKind::PathInvalid);
}

TEST(ValidatePath, RejectsOverlong) {
    std::string p = "/" + std::string(MAX_PATH_LENGTH, 'a');
    EXPECT_EQ(validate_path(p, "host path").kind, ErrorKind::PathInvalid);
}

TEST(ValidatePermissions, OctalForms) {
    EXPECT_TRUE(validate_permissions("644").is_ok());
    EXPECT_TRUE(validate_permissions("0755").is_ok());
    EXPECT_TRUE(validate_permissions("600").is_ok());
}

TEST(ValidatePermissions, RejectsOthers) {
    for (const char* bad : {"", "64", "888", "rwx", "07777", "644 ", "+x"}) {
        auto r = validate_permissions(bad);
        EXPECT_TRUE(r.is_err()) << bad;
        EXPECT_EQ(r.kind, ErrorKind::PermissionInvalid) << bad;
        EXPECT_TRUE(is_validation_error(r.kind));
    }
}

TEST(CheckSize, AtCeilingPasses) {
    EXPECT_TRUE(check_size(0, 100).is_ok());
    EXPECT_TRUE(check_size(100, 100).is_ok());
}

TEST(CheckSize, OverCeilingCarriesBothValues) {
    auto r = check_size(15 * 1024 * 1024, 10 * 1024 * 1024);
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.kind, ErrorKind::SizeExceedsLimit);
    EXPECT_NE(r.error.find("15728640"), std::string::npos);
    EXPECT_NE(r.error.find("10485760"), std::string::npos);
}
