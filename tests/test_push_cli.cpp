#include <gtest/gtest.h>
#include <cli/push_cli.hpp>
#include <cstdlib>

TEST(PushArgs, Minimal) {
    auto r = parse_push_args({"a.bin", "/tmp/a.bin", "--host", "box"});
    ASSERT_TRUE(r.is_ok()) << r.error;
    EXPECT_EQ(r.value.local_path, "a.bin");
    EXPECT_EQ(r.value.remote_path, "/tmp/a.bin");
    EXPECT_EQ(r.value.host, "box");
    EXPECT_FALSE(r.value.port.has_value());
    EXPECT_FALSE(r.value.ask_password);
}

TEST(PushArgs, AllOptions) {
    auto r = parse_push_args({"-H", "h", "-p", "2222", "-u", "me", "-i", "/k",
                              "--password-env", "PW", "--backend", "raw-pipe",
                              "--config", "/c.yaml", "x", "y"});
    ASSERT_TRUE(r.is_ok()) << r.error;
    EXPECT_EQ(r.value.port, std::optional<int>(2222));
    EXPECT_EQ(r.value.user, std::optional<std::string>("me"));
    EXPECT_EQ(r.value.ssh_key_path, std::optional<std::string>("/k"));
    EXPECT_EQ(r.value.password_env, std::optional<std::string>("PW"));
    EXPECT_EQ(r.value.backend, std::optional<std::string>("raw-pipe"));
    EXPECT_EQ(r.value.config_path, std::optional<std::string>("/c.yaml"));
}

TEST(PushArgs, Errors) {
    EXPECT_TRUE(parse_push_args({"a", "b"}).is_err());                       // no host
    EXPECT_TRUE(parse_push_args({"a", "--host", "h"}).is_err());             // one path
    EXPECT_TRUE(parse_push_args({"a", "b", "--host"}).is_err());             // missing value
    EXPECT_TRUE(parse_push_args({"a", "b", "--host", "h", "-p", "0"}).is_err());
    EXPECT_TRUE(parse_push_args({"a", "b", "--host", "h", "-p", "http"}).is_err());
    EXPECT_TRUE(parse_push_args({"a", "b", "--host", "h", "--verbose"}).is_err());
    EXPECT_TRUE(parse_push_args({"a", "b", "--host", "h", "--ask-password",
                                 "--password-env", "X"}).is_err());
}

TEST(BuildRequest, FlagsOverrideProfile) {
    auto config = Config::parse("hosts:\n  box:\n    host: 10.0.0.5\n    user: deploy\n    password: pw\n");
    ASSERT_TRUE(config.is_ok());

    auto args = parse_push_args({"a", "b", "--host", "box", "-u", "root", "-p", "2022"});
    ASSERT_TRUE(args.is_ok());

    auto req = build_request(config.value, args.value);
    ASSERT_TRUE(req.is_ok()) << req.error;
    EXPECT_EQ(req.value.host, "10.0.0.5");
    EXPECT_EQ(req.value.user, "root");
    EXPECT_EQ(req.value.port, 2022);
    EXPECT_EQ(req.value.password, std::optional<std::string>("pw"));
}

TEST(BuildRequest, PasswordFromEnvironment) {
    setenv("SHELLPUSH_TEST_PW", "from-env", 1);
    auto args = parse_push_args({"a", "b", "--host", "h", "--password-env", "SHELLPUSH_TEST_PW"});
    ASSERT_TRUE(args.is_ok());

    auto req = build_request(Config(), args.value);
    ASSERT_TRUE(req.is_ok());
    EXPECT_EQ(req.value.password, std::optional<std::string>("from-env"));
    unsetenv("SHELLPUSH_TEST_PW");
}

TEST(BuildRequest, UnsetPasswordVariable) {
    unsetenv("SHELLPUSH_TEST_UNSET");
    auto args = parse_push_args({"a", "b", "--host", "h", "--password-env", "SHELLPUSH_TEST_UNSET"});
    ASSERT_TRUE(args.is_ok());
    EXPECT_TRUE(build_request(Config(), args.value).is_err());
}
