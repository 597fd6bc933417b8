#define BOOST_TEST_MODULE TestBackupError
#include <boost/test/unit_test.hpp>
#include "backup_error.hpp"

BOOST_AUTO_TEST_CASE(TestDescribeError)
{
    BackupError error(ErrorKind::SizeLimitExceeded, "Backup size (120000MB) exceeds maximum allowed size (102400MB)");
    BOOST_CHECK_EQUAL(describeError(error),
                      "SizeLimitExceeded: Backup size (120000MB) exceeds maximum allowed size (102400MB)");
    BOOST_CHECK_EQUAL(errorKindName(ErrorKind::Hook), "HookError");
    BOOST_CHECK_EQUAL(errorKindName(ErrorKind::Retention), "RetentionError");
}

BOOST_AUTO_TEST_CASE(TestSanitizeRedactsCredentials)
{
    std::string cleaned = sanitizeErrorMessage("login failed: password=hunter2, token = abc123; user=bob");
    BOOST_CHECK(cleaned.find("hunter2") == std::string::npos);
    BOOST_CHECK(cleaned.find("abc123") == std::string::npos);
    BOOST_CHECK(cleaned.find("password=<redacted>") != std::string::npos);
    BOOST_CHECK(cleaned.find("user=bob") != std::string::npos);
}

BOOST_AUTO_TEST_CASE(TestSanitizeHidesPaths)
{
    std::string cleaned = sanitizeErrorMessage("Failed to open file: /srv/app/db/secret.key (Permission denied)");
    BOOST_CHECK_EQUAL(cleaned, "Failed to open file: <path> (Permission denied)");

    cleaned = sanitizeErrorMessage("cannot stat '/var/lib/docker/volumes/web'");
    BOOST_CHECK_EQUAL(cleaned, "cannot stat '<path>'");

    /* an S3 key is not a filesystem path */
    cleaned = sanitizeErrorMessage("HTTP 403 for backups/web/x.gpg");
    BOOST_CHECK_EQUAL(cleaned, "HTTP 403 for backups/web/x.gpg");
}

BOOST_AUTO_TEST_CASE(TestSanitizeTruncates)
{
    std::string cleaned = sanitizeErrorMessage(std::string(2000, 'x'));
    BOOST_CHECK_EQUAL(cleaned.size(), 512u);
    BOOST_CHECK(cleaned.ends_with("..."));
}

BOOST_AUTO_TEST_CASE(TestDiagnosticModeKeepsMessage)
{
    const std::string message = "open /srv/app failed with password=hunter2 " + std::string(600, 'x');
    BOOST_CHECK_EQUAL(sanitizeErrorMessage(message, true), message);
}
