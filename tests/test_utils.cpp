#include <gtest/gtest.h>
#include <core/utils.hpp>

TEST(Utils, ParseByteCountPlain) {
    EXPECT_EQ(parse_byte_count("2048"), std::optional<std::uint64_t>(2048));
}

TEST(Utils, ParseByteCountPadded) {
    EXPECT_EQ(parse_byte_count("     2048\n"), std::optional<std::uint64_t>(2048));
    EXPECT_EQ(parse_byte_count("0\r\n"), std::optional<std::uint64_t>(0));
}

TEST(Utils, ParseByteCountRejectsGarbage) {
    EXPECT_FALSE(parse_byte_count("").has_value());
    EXPECT_FALSE(parse_byte_count("   ").has_value());
    EXPECT_FALSE(parse_byte_count("12a").has_value());
    EXPECT_FALSE(parse_byte_count("-1").has_value());
    EXPECT_FALSE(parse_byte_count("wc: /tmp/x: No such file").has_value());
    EXPECT_FALSE(parse_byte_count("2048 /tmp/x").has_value());
    EXPECT_FALSE(parse_byte_count("99999999999999999999").has_value());
}

TEST(Utils, ShellQuoteSafePaths) {
    EXPECT_EQ(shell_quote("/tmp/out.bin"), "/tmp/out.bin");
    EXPECT_EQ(shell_quote("~/data/file-1_2.tar.gz"), "~/data/file-1_2.tar.gz");
}

TEST(Utils, ShellQuoteSpecialCharacters) {
    EXPECT_EQ(shell_quote("/tmp/a b"), "'/tmp/a b'");
    EXPECT_EQ(shell_quote("/tmp/$HOME"), "'/tmp/$HOME'");
    EXPECT_EQ(shell_quote("it's"), "'it'\\''s'");
    EXPECT_EQ(shell_quote(""), "''");
}

TEST(Utils, ShellQuoteTildeOnlyLeading) {
    EXPECT_EQ(shell_quote("/tmp/~x"), "'/tmp/~x'");
}

TEST(Utils, FormatProgress) {
    EXPECT_EQ(format_progress(1, 3), "1/3 (33.3%)");
    EXPECT_EQ(format_progress(100, 100), "100/100 (100.0%)");
    EXPECT_EQ(format_progress(0, 0), "0/0 (100.0%)");
}

TEST(Utils, BackendNames) {
    EXPECT_STREQ(backend_name(Backend::CLIENT_LIBRARY), "client-library");
    EXPECT_STREQ(backend_name(Backend::PASSWORD_HELPER), "password-helper");
    EXPECT_STREQ(backend_name(Backend::NATIVE_OPENSSH), "native-openssh");
    EXPECT_STREQ(backend_name(Backend::RAW_PIPE), "raw-pipe");
}

TEST(Utils, ParseBackendAliases) {
    EXPECT_EQ(parse_backend("client-library"), Backend::CLIENT_LIBRARY);
    EXPECT_EQ(parse_backend("LIBSSH2"), Backend::CLIENT_LIBRARY);
    EXPECT_EQ(parse_backend("password_helper"), Backend::PASSWORD_HELPER);
    EXPECT_EQ(parse_backend("sshpass"), Backend::PASSWORD_HELPER);
    EXPECT_EQ(parse_backend("openssh"), Backend::NATIVE_OPENSSH);
    EXPECT_EQ(parse_backend("pipe"), Backend::RAW_PIPE);
    EXPECT_FALSE(parse_backend("scp").has_value());
}

TEST(Utils, SafeStoi) {
    EXPECT_EQ(safe_stoi("42"), 42);
    EXPECT_EQ(safe_stoi("x", -1), -1);
}
