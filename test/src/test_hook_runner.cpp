#define BOOST_TEST_MODULE TestHookRunner
#include <boost/test/unit_test.hpp>
#include "hook_runner.hpp"

BOOST_AUTO_TEST_CASE(TestValidateAcceptsPlainCommands)
{
    for (const char* command : {"/usr/local/bin/pause-db --wait 30", "docker stop web-1",
                                "pg_ctl -D /srv/pg \"stop\"", "echo key=value"}) {
        BOOST_CHECK_MESSAGE(validateHookCommand(command).has_value(), command);
    }
}

BOOST_AUTO_TEST_CASE(TestValidateRejectsShellSyntax)
{
    for (const char* command : {"echo a; rm -rf /", "echo $(id)", "echo `id`", "true && false",
                                "true || false", "cat a | nc host 1", "echo > /dev/sda", "rm -rf /srv",
                                "dd if=/dev/zero of=/dev/sda", "mkfs.ext4 /dev/sdb", "echo $HOME"}) {
        auto result = validateHookCommand(command);
        BOOST_REQUIRE_MESSAGE(!result.has_value(), command);
        BOOST_CHECK(result.error().kind == ErrorKind::Hook);
    }
}

BOOST_AUTO_TEST_CASE(TestSplitCommandLine)
{
    auto words = splitCommandLine("  backup-helper --label \"nightly run\" 'a b'  x");
    BOOST_REQUIRE(words.has_value());
    BOOST_REQUIRE_EQUAL(words->size(), 5u);
    BOOST_CHECK_EQUAL((*words)[0], "backup-helper");
    BOOST_CHECK_EQUAL((*words)[1], "--label");
    BOOST_CHECK_EQUAL((*words)[2], "nightly run");
    BOOST_CHECK_EQUAL((*words)[3], "a b");
    BOOST_CHECK_EQUAL((*words)[4], "x");

    auto empty = splitCommandLine("\"\"");
    BOOST_REQUIRE(empty.has_value());
    BOOST_CHECK_EQUAL(empty->size(), 1u);

    BOOST_CHECK(!splitCommandLine("echo \"unterminated").has_value());
    BOOST_CHECK(!splitCommandLine("   ").has_value());
}

BOOST_AUTO_TEST_CASE(TestRunHook)
{
    BOOST_CHECK(runHook("true").has_value());
    BOOST_CHECK(runHook("").has_value());
    BOOST_CHECK(runHook("   ").has_value());

    auto failed = runHook("false");
    BOOST_REQUIRE(!failed.has_value());
    BOOST_CHECK(failed.error().kind == ErrorKind::Hook);
    BOOST_CHECK(failed.error().message.find("exit code 1") != std::string::npos);

    auto missing = runHook("snapvault-no-such-hook-binary");
    BOOST_REQUIRE(!missing.has_value());
    BOOST_CHECK(missing.error().kind == ErrorKind::Hook);

    /* rejected before anything is executed */
    BOOST_CHECK(!runHook("true; false").has_value());
}
