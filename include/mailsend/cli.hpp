/*

cli.hpp
-------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

Command line front end: argument parsing with Boost.Program_options and reporting of the send result.

*/

#pragma once

#include <chrono>
#include <functional>
#include <ostream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include <boost/program_options.hpp>

#include <mailsend/detail/log.hpp>
#include <mailsend/detail/result.hpp>
#include <mailsend/net/tls_options.hpp>
#include <mailsend/sender.hpp>
#include <mailsend/smtp/types.hpp>

namespace mailsend::cli
{

namespace po = boost::program_options;

/// Exit status of a command line that cannot be parsed.
inline constexpr int EXIT_USAGE = 2;

/// Exit status of a failed send when strict exit codes are requested.
inline constexpr int EXIT_SEND_FAILED = 1;

/**
Invalid command line: missing, unknown, duplicated or malformed argument.
**/
class usage_error : public std::runtime_error
{
public:
    explicit usage_error(const std::string& msg) : std::runtime_error(msg)
    {
    }
};

/**
Parsed command line.
**/
struct cli_options
{
    send_config config;
    bool help = false;
    bool strict_exit = false;
    log::level log_level = log::level::warn;
    bool trace = false;
};

using sender_t = std::function<result<void>(const send_config&)>;

/**
Names of the mandatory arguments, in the order they are listed in the usage text.
**/
inline const std::vector<std::string>& required_arguments()
{
    static const std::vector<std::string> names{"smtp_server", "smtp_port", "smtp_user", "smtp_password",
        "from_email", "to_email", "subject", "body"};
    return names;
}

inline po::options_description make_options_description()
{
    po::options_description required("Required arguments");
    required.add_options()
        ("smtp_server", po::value<std::string>()->required()->value_name("HOST"), "SMTP server address")
        ("smtp_port", po::value<int>()->required()->value_name("PORT"), "SMTP server port (implicit TLS)")
        ("smtp_user", po::value<std::string>()->required()->value_name("USER"), "SMTP username")
        ("smtp_password", po::value<std::string>()->required()->value_name("PASSWORD"), "SMTP password")
        ("from_email", po::value<std::string>()->required()->value_name("ADDRESS"), "Sender email address")
        ("to_email", po::value<std::string>()->required()->value_name("ADDRESS"), "Recipient email address")
        ("subject", po::value<std::string>()->required()->value_name("TEXT"), "Email subject")
        ("body", po::value<std::string>()->required()->value_name("TEXT"), "Email body");

    po::options_description optional("Options");
    optional.add_options()
        ("help,h", "Show this help message and exit")
        ("timeout", po::value<int>()->value_name("SECONDS"), "Deadline of each network operation (default: none)")
        ("auth_method", po::value<std::string>()->default_value("auto")->value_name("METHOD"),
            "SASL mechanism: auto, plain, login or cram-md5")
        ("insecure", po::bool_switch(), "Do not verify the server certificate and host name")
        ("strict_exit", po::bool_switch(), "Exit with status 1 when sending fails")
        ("log_level", po::value<std::string>()->default_value("warn")->value_name("LEVEL"),
            "Diagnostic level: trace, debug, info, warn, error or off")
        ("trace", po::bool_switch(), "Trace the SMTP dialog on standard error, credentials redacted");

    po::options_description all("Send an email using SMTP over implicit TLS");
    all.add(required).add(optional);
    return all;
}

/**
One line synopsis in the form `usage: mailsend --smtp_server HOST ...`.
**/
inline std::string usage_line(const std::string& program)
{
    std::string line = "usage: " + program + " [-h]";
    for (const auto& name : required_arguments())
    {
        std::string upper;
        for (char ch : name)
            upper.push_back(ch >= 'a' && ch <= 'z' ? static_cast<char>(ch - ('a' - 'A')) : ch);
        line += " --" + name + " " + upper;
    }
    return line;
}

inline std::string usage_text(const std::string& program)
{
    std::ostringstream text;
    text << usage_line(program) << "\n\n" << make_options_description();
    return text.str();
}

/**
Parsing the command line into the send configuration.

@param argc Number of arguments, program name included.
@param argv Arguments.
@return     Parsed options; when `help` is set the other fields are not meaningful.
@throw usage_error Missing, unknown, duplicated, empty or malformed argument, or a positional argument.
**/
inline cli_options parse_arguments(int argc, const char* const argv[])
{
    const po::options_description description = make_options_description();
    // No positional arguments are accepted.
    const po::positional_options_description positional;
    po::variables_map vm;
    try
    {
        po::store(po::command_line_parser(argc, argv).options(description).positional(positional).run(), vm);
        if (vm.count("help") > 0)
        {
            cli_options opts;
            opts.help = true;
            return opts;
        }
        po::notify(vm);
    }
    catch (const po::error& exc)
    {
        throw usage_error(exc.what());
    }

    for (const auto& name : required_arguments())
    {
        if (name != "smtp_port" && vm[name].as<std::string>().empty())
            throw usage_error("the argument '--" + name + "' must not be empty");
    }

    cli_options opts;
    send_config& cfg = opts.config;
    const int port = vm["smtp_port"].as<int>();
    if (port < 1 || port > 65535)
        throw usage_error("the argument '--smtp_port' must be between 1 and 65535");
    cfg.smtp_port = static_cast<unsigned short>(port);
    cfg.smtp_server = vm["smtp_server"].as<std::string>();
    cfg.smtp_user = vm["smtp_user"].as<std::string>();
    cfg.smtp_password = vm["smtp_password"].as<std::string>();
    cfg.from_email = vm["from_email"].as<std::string>();
    cfg.to_email = vm["to_email"].as<std::string>();
    cfg.subject = vm["subject"].as<std::string>();
    cfg.body = vm["body"].as<std::string>();

    if (vm.count("timeout") > 0)
    {
        const int seconds = vm["timeout"].as<int>();
        if (seconds <= 0)
            throw usage_error("the argument '--timeout' must be a positive number of seconds");
        cfg.timeout = std::chrono::seconds(seconds);
    }

    const auto method = smtp::auth_method_from_string(vm["auth_method"].as<std::string>());
    if (!method.has_value())
        throw usage_error("invalid value '" + vm["auth_method"].as<std::string>() + "' for '--auth_method'");
    cfg.auth = *method;

    if (vm["insecure"].as<bool>())
        cfg.tls = net::tls_options::insecure();

    const auto level = log::level_from_string(vm["log_level"].as<std::string>());
    if (!level.has_value())
        throw usage_error("invalid value '" + vm["log_level"].as<std::string>() + "' for '--log_level'");
    opts.log_level = *level;

    opts.strict_exit = vm["strict_exit"].as<bool>();
    opts.trace = vm["trace"].as<bool>();
    return opts;
}

/**
Running the command: parse, send, report.

On a send failure exactly one line `Failed to send email: <details>` is written to `err`; the exit status stays 0
unless `--strict_exit` is given.

@param argc   Number of arguments, program name included.
@param argv   Arguments.
@param out    Stream receiving the help text.
@param err    Stream receiving the usage diagnostics and the failure line.
@param sender Function performing the send.
@return       Process exit status.
**/
inline int run_cli(int argc, const char* const argv[], std::ostream& out, std::ostream& err,
    const sender_t& sender = send_mail)
{
    const std::string program = argc > 0 && argv[0] != nullptr ? std::string(argv[0]) : std::string("mailsend");

    cli_options opts;
    try
    {
        opts = parse_arguments(argc, argv);
    }
    catch (const usage_error& exc)
    {
        err << usage_line(program) << '\n' << program << ": error: " << exc.what() << '\n';
        return EXIT_USAGE;
    }

    if (opts.help)
    {
        out << usage_text(program);
        return 0;
    }

    const log::scoped_config log_config(opts.log_level, opts.trace, err);

    const send_config& cfg = opts.config;
    MAILSEND_INFO("Sending email from " + cfg.from_email + " to " + cfg.to_email + " through " + cfg.smtp_server
        + ":" + std::to_string(cfg.smtp_port));

    const result<void> sent = sender(cfg);
    if (!sent)
    {
        MAILSEND_DEBUG("Send failed with category " + std::string(to_string(sent.error().code)));
        err << "Failed to send email: " << sent.error().to_string() << '\n';
        return opts.strict_exit ? EXIT_SEND_FAILED : 0;
    }
    return 0;
}

} // namespace mailsend::cli
