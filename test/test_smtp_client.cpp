/*

test_smtp_client.cpp
--------------------

Copyright (C) 2025, Sylvain Guinebert.

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

Runs smtp::client against a scripted server on a plain loopback connection.

*/


#define BOOST_TEST_MODULE smtp_client_test

#include <chrono>
#include <exception>
#include <functional>
#include <istream>
#include <string>
#include <string_view>
#include <thread>
#include <utility>
#include <vector>
#include <boost/test/unit_test.hpp>
#include <mailsend/detail/log.hpp>
#include <mailsend/detail/sasl.hpp>
#include <mailsend/mime/message.hpp>
#include <mailsend/net/dialog.hpp>
#include <mailsend/smtp/client.hpp>

using mailsend::errc;
using mailsend::message;
using mailsend::message_format_options_t;
using mailsend::net::dialog_error;
using mailsend::net::tls_mode;
using mailsend::smtp::client;

namespace asio = mailsend::asio;
namespace smtp = mailsend::smtp;
using tcp = asio::ip::tcp;

namespace
{

class mock_session
{
public:
    explicit mock_session(tcp::socket& socket) : socket_(socket)
    {
    }

    std::string read_line()
    {
        asio::read_until(socket_, buffer_, "\r\n");
        std::istream is(&buffer_);
        std::string line;
        std::getline(is, line);
        if (!line.empty() && line.back() == '\r')
            line.pop_back();
        return line;
    }

    // Message data up to and including the terminating dot line.
    std::string read_data()
    {
        std::string data;
        for (;;)
        {
            const std::string line = read_line();
            data += line + "\r\n";
            if (line == ".")
                return data;
        }
    }

    void write(std::string_view text)
    {
        asio::write(socket_, asio::buffer(text.data(), text.size()));
    }

    // Reads one command and answers it.
    std::string expect(std::string_view response)
    {
        std::string line = read_line();
        write(response);
        return line;
    }

private:
    tcp::socket& socket_;
    asio::streambuf buffer_;
};

class mock_server
{
public:
    using script_t = std::function<void(mock_session&)>;

    explicit mock_server(script_t script)
        : acceptor_(context_, tcp::endpoint(asio::ip::make_address("127.0.0.1"), 0)),
          port_(acceptor_.local_endpoint().port()),
          thread_([this, script = std::move(script)]() { run(script); })
    {
    }

    ~mock_server()
    {
        join();
    }

    unsigned short port() const
    {
        return port_;
    }

    void join()
    {
        if (thread_.joinable())
            thread_.join();
    }

    const std::string& failure() const
    {
        return failure_;
    }

private:
    void run(const script_t& script)
    {
        try
        {
            tcp::socket socket(context_);
            acceptor_.accept(socket);
            mock_session session(socket);
            script(session);
        }
        catch (const std::exception& exc)
        {
            failure_ = exc.what();
        }
    }

    asio::io_context context_;
    tcp::acceptor acceptor_;
    unsigned short port_;
    std::string failure_;
    std::thread thread_;
};

template<typename F>
void run_client(F&& session)
{
    asio::io_context context;
    auto fut = asio::co_spawn(context, std::forward<F>(session), asio::use_future);
    context.run();
    fut.get();
}

smtp::options plain_options()
{
    smtp::options opts;
    opts.default_tls_mode = tls_mode::none;
    opts.helo_name = "client.example.com";
    return opts;
}

const std::string EHLO_REPLY =
    "250-mock.example.com Hello client.example.com\r\n"
    "250-SIZE 10240000\r\n"
    "250-AUTH PLAIN LOGIN\r\n"
    "250 8BITMIME\r\n";

} // namespace


BOOST_AUTO_TEST_CASE(send_with_plain_auth)
{
    const message msg("Alice <alice@example.com>", "bob@example.com", "Hi", "Hello\r\n.dot line\r\nBye");
    std::vector<std::string> commands;
    std::string data;

    mock_server server([&](mock_session& s)
    {
        s.write("220 mock.example.com ESMTP ready\r\n");
        commands.push_back(s.expect(EHLO_REPLY));
        commands.push_back(s.expect("235 2.7.0 Authentication successful\r\n"));
        commands.push_back(s.expect("250 2.1.0 OK\r\n"));
        commands.push_back(s.expect("250 2.1.5 OK\r\n"));
        commands.push_back(s.expect("354 End data with <CR><LF>.<CR><LF>\r\n"));
        data = s.read_data();
        s.write("250 2.0.0 Queued\r\n");
        commands.push_back(s.expect("221 2.0.0 Bye\r\n"));
    });

    int data_status = 0;
    bool has_size = false;
    std::string server_name;
    run_client([&]() -> asio::awaitable<void>
    {
        client cli(co_await asio::this_coro::executor, plain_options());
        co_await cli.connect("127.0.0.1", server.port());
        co_await cli.read_greeting();
        co_await cli.ehlo();
        has_size = cli.server_capabilities().supports("size");
        server_name = cli.server_name();
        co_await cli.authenticate("alice@example.com", "secret");
        const smtp::reply rep = co_await cli.send(msg);
        data_status = rep.status;
        co_await cli.quit();
        BOOST_CHECK(!cli.is_connected());
    });
    server.join();

    BOOST_TEST(server.failure() == "");
    BOOST_TEST(has_size);
    BOOST_TEST(server_name == "mock.example.com");
    BOOST_TEST(data_status == 250);

    message_format_options_t opts;
    opts.dot_escape = true;
    const std::string expected_data = msg.format(opts) + ".\r\n";
    BOOST_TEST(data == expected_data);
    BOOST_TEST(data.find("\r\n..dot line\r\n") != std::string::npos);

    BOOST_REQUIRE_EQUAL(commands.size(), 6u);
    BOOST_TEST(commands[0] == "EHLO client.example.com");
    BOOST_TEST(commands[1] == "AUTH PLAIN " + mailsend::sasl::encode_plain("alice@example.com", "secret"));
    BOOST_TEST(commands[2] == "MAIL FROM:<alice@example.com> SIZE=" + std::to_string(expected_data.size()));
    BOOST_TEST(commands[3] == "RCPT TO:<bob@example.com>");
    BOOST_TEST(commands[4] == "DATA");
    BOOST_TEST(commands[5] == "QUIT");
}


BOOST_AUTO_TEST_CASE(auth_falls_back_to_next_mechanism)
{
    const std::string challenge = "PDE4OTYuNjk3MTcwOTUyQHBvc3RvZmZpY2UucmVzdG9uLm1jaS5uZXQ+";
    std::vector<std::string> commands;

    mock_server server([&](mock_session& s)
    {
        s.write("220 mock.example.com ESMTP\r\n");
        s.expect("250-mock.example.com\r\n250 AUTH LOGIN PLAIN CRAM-MD5\r\n");
        commands.push_back(s.expect("334 " + challenge + "\r\n"));
        commands.push_back(s.expect("535 5.7.8 Bad credentials\r\n"));
        commands.push_back(s.expect("535 5.7.8 Bad credentials\r\n"));
        commands.push_back(s.expect("334 VXNlcm5hbWU6\r\n"));
        commands.push_back(s.expect("334 UGFzc3dvcmQ6\r\n"));
        commands.push_back(s.expect("235 2.7.0 Accepted\r\n"));
        s.expect("221 Bye\r\n");
    });

    bool authenticated = false;
    run_client([&]() -> asio::awaitable<void>
    {
        client cli(co_await asio::this_coro::executor, plain_options());
        co_await cli.connect("127.0.0.1", server.port());
        co_await cli.read_greeting();
        co_await cli.ehlo();
        co_await cli.authenticate("tim", "tanstaaftanstaaf");
        authenticated = cli.is_authenticated();
        co_await cli.quit();
    });
    server.join();

    BOOST_TEST(server.failure() == "");
    BOOST_TEST(authenticated);
    BOOST_REQUIRE_EQUAL(commands.size(), 6u);
    BOOST_TEST(commands[0] == "AUTH CRAM-MD5");
    BOOST_TEST(commands[1] == "dGltIGI5MTNhNjAyYzdlZGE3YTQ5NWI0ZTZlNzMzNGQzODkw");
    BOOST_TEST(commands[2] == "AUTH PLAIN " + mailsend::sasl::encode_plain("tim", "tanstaaftanstaaf"));
    BOOST_TEST(commands[3] == "AUTH LOGIN");
    BOOST_TEST(commands[4] == "dGlt");
    BOOST_TEST(commands[5] == "dGFuc3RhYWZ0YW5zdGFhZg==");
}


BOOST_AUTO_TEST_CASE(auth_rejected)
{
    std::string last_command;
    mock_server server([&](mock_session& s)
    {
        s.write("220 mock.example.com ESMTP\r\n");
        s.expect(EHLO_REPLY);
        s.expect("535 5.7.8 Bad credentials\r\n");
        s.expect("535 5.7.8 Bad credentials\r\n");
        last_command = s.expect("221 Bye\r\n");
    });

    errc code = errc::ok;
    int status = 0;
    std::string details;
    run_client([&]() -> asio::awaitable<void>
    {
        client cli(co_await asio::this_coro::executor, plain_options());
        co_await cli.connect("127.0.0.1", server.port());
        co_await cli.read_greeting();
        co_await cli.ehlo();
        try
        {
            co_await cli.authenticate("alice", "wrong");
        }
        catch (const smtp::error& exc)
        {
            code = exc.code();
            status = exc.status();
            details = exc.details();
        }
        BOOST_CHECK(!cli.is_authenticated());
        co_await cli.quit();
    });
    server.join();

    BOOST_TEST(server.failure() == "");
    BOOST_TEST(code == errc::smtp_auth_failed);
    BOOST_TEST(status == 535);
    BOOST_TEST(details == "535 5.7.8 Bad credentials");
    BOOST_TEST(last_command == "QUIT");
}


BOOST_AUTO_TEST_CASE(auth_explicit_mechanism_not_advertised)
{
    mock_server server([&](mock_session& s)
    {
        s.write("220 mock.example.com ESMTP\r\n");
        s.expect(EHLO_REPLY);
        s.expect("221 Bye\r\n");
    });

    errc code = errc::ok;
    run_client([&]() -> asio::awaitable<void>
    {
        client cli(co_await asio::this_coro::executor, plain_options());
        co_await cli.connect("127.0.0.1", server.port());
        co_await cli.read_greeting();
        co_await cli.ehlo();
        try
        {
            co_await cli.authenticate("alice", "secret", smtp::auth_method::cram_md5);
        }
        catch (const smtp::error& exc)
        {
            code = exc.code();
        }
        co_await cli.quit();
    });
    server.join();

    BOOST_TEST(server.failure() == "");
    BOOST_TEST(code == errc::smtp_auth_unsupported);
}


BOOST_AUTO_TEST_CASE(helo_fallback_without_auth)
{
    std::vector<std::string> commands;
    mock_server server([&](mock_session& s)
    {
        s.write("220 old.example.com SMTP\r\n");
        commands.push_back(s.expect("502 5.5.2 Command not implemented\r\n"));
        commands.push_back(s.expect("250 old.example.com\r\n"));
        s.expect("221 Bye\r\n");
    });

    int helo_status = 0;
    bool caps_empty = false;
    errc code = errc::ok;
    run_client([&]() -> asio::awaitable<void>
    {
        client cli(co_await asio::this_coro::executor, plain_options());
        co_await cli.connect("127.0.0.1", server.port());
        co_await cli.read_greeting();
        const smtp::reply rep = co_await cli.ehlo();
        helo_status = rep.status;
        caps_empty = cli.server_capabilities().empty();
        try
        {
            co_await cli.authenticate("alice", "secret");
        }
        catch (const smtp::error& exc)
        {
            code = exc.code();
        }
        co_await cli.quit();
    });
    server.join();

    BOOST_TEST(server.failure() == "");
    BOOST_TEST(helo_status == 250);
    BOOST_TEST(caps_empty);
    BOOST_TEST(code == errc::smtp_auth_unsupported);
    BOOST_REQUIRE_EQUAL(commands.size(), 2u);
    BOOST_TEST(commands[0] == "EHLO client.example.com");
    BOOST_TEST(commands[1] == "HELO client.example.com");
}


BOOST_AUTO_TEST_CASE(greeting_rejected)
{
    mock_server server([&](mock_session& s)
    {
        s.write("554 5.3.2 No service for you\r\n");
        s.expect("221 Bye\r\n");
    });

    errc code = errc::ok;
    std::string details;
    run_client([&]() -> asio::awaitable<void>
    {
        client cli(co_await asio::this_coro::executor, plain_options());
        co_await cli.connect("127.0.0.1", server.port());
        try
        {
            co_await cli.read_greeting();
        }
        catch (const smtp::error& exc)
        {
            code = exc.code();
            details = exc.details();
        }
        co_await cli.quit();
    });
    server.join();

    BOOST_TEST(code == errc::smtp_greeting_rejected);
    BOOST_TEST(details == "554 5.3.2 No service for you");
}


BOOST_AUTO_TEST_CASE(malformed_reply)
{
    mock_server server([&](mock_session& s)
    {
        s.write("hello there\r\n");
        s.read_line();
    });

    errc code = errc::ok;
    run_client([&]() -> asio::awaitable<void>
    {
        client cli(co_await asio::this_coro::executor, plain_options());
        co_await cli.connect("127.0.0.1", server.port());
        try
        {
            co_await cli.read_greeting();
        }
        catch (const smtp::error& exc)
        {
            code = exc.code();
        }
        cli.close();
    });
    server.join();

    BOOST_TEST(code == errc::smtp_bad_reply);
}


BOOST_AUTO_TEST_CASE(recipient_rejected)
{
    mock_server server([&](mock_session& s)
    {
        s.write("220 mock.example.com ESMTP\r\n");
        s.expect("250 mock.example.com\r\n");
        s.expect("250 OK\r\n");
        s.expect("550 5.1.1 No such user\r\n");
        s.expect("221 Bye\r\n");
    });

    errc code = errc::ok;
    int status = 0;
    run_client([&]() -> asio::awaitable<void>
    {
        client cli(co_await asio::this_coro::executor, plain_options());
        co_await cli.connect("127.0.0.1", server.port());
        co_await cli.read_greeting();
        co_await cli.ehlo();
        try
        {
            co_await cli.send(message("a@example.com", "nobody@example.com", "Hi", "x"));
        }
        catch (const smtp::error& exc)
        {
            code = exc.code();
            status = exc.status();
        }
        co_await cli.quit();
    });
    server.join();

    BOOST_TEST(server.failure() == "");
    BOOST_TEST(code == errc::smtp_rejected_recipient);
    BOOST_TEST(status == 550);
}


BOOST_AUTO_TEST_CASE(service_unavailable_closes_session)
{
    mock_server server([&](mock_session& s)
    {
        s.write("220 mock.example.com ESMTP\r\n");
        s.expect("250 mock.example.com\r\n");
        s.expect("421 4.3.2 Shutting down\r\n");
    });

    errc code = errc::ok;
    bool connected = true;
    run_client([&]() -> asio::awaitable<void>
    {
        client cli(co_await asio::this_coro::executor, plain_options());
        co_await cli.connect("127.0.0.1", server.port());
        co_await cli.read_greeting();
        co_await cli.ehlo();
        try
        {
            co_await cli.send(message("a@example.com", "b@example.com", "Hi", "x"));
        }
        catch (const smtp::error& exc)
        {
            code = exc.code();
        }
        connected = cli.is_connected();
    });
    server.join();

    BOOST_TEST(code == errc::smtp_temporary_failure);
    BOOST_TEST(!connected);
}


BOOST_AUTO_TEST_CASE(greeting_timeout)
{
    // The server never greets; the client gives up and closes, ending the server read.
    mock_server server([&](mock_session& s)
    {
        s.read_line();
    });

    errc code = errc::ok;
    run_client([&]() -> asio::awaitable<void>
    {
        smtp::options opts = plain_options();
        opts.timeout = std::chrono::milliseconds(200);
        client cli(co_await asio::this_coro::executor, opts);
        co_await cli.connect("127.0.0.1", server.port());
        try
        {
            co_await cli.read_greeting();
        }
        catch (const dialog_error& exc)
        {
            code = exc.code();
        }
        cli.close();
    });
    server.join();

    BOOST_TEST(code == errc::net_timeout);
}


BOOST_AUTO_TEST_CASE(connection_refused)
{
    unsigned short port = 0;
    {
        asio::io_context context;
        tcp::acceptor acceptor(context, tcp::endpoint(asio::ip::make_address("127.0.0.1"), 0));
        port = acceptor.local_endpoint().port();
    }

    errc code = errc::ok;
    std::string details;
    run_client([&]() -> asio::awaitable<void>
    {
        client cli(co_await asio::this_coro::executor, plain_options());
        try
        {
            co_await cli.connect("127.0.0.1", port);
        }
        catch (const dialog_error& exc)
        {
            code = exc.code();
            details = exc.details();
        }
    });

    BOOST_TEST(code == errc::net_connection_refused);
    BOOST_TEST(details.rfind("127.0.0.1:" + std::to_string(port) + " connect failed: ", 0) == 0u);
}


BOOST_AUTO_TEST_CASE(trace_redacts_credentials)
{
    mock_server server([&](mock_session& s)
    {
        s.write("220 mock.example.com ESMTP\r\n");
        s.expect(EHLO_REPLY);
        s.expect("235 OK\r\n");
        s.expect("250 OK\r\n");
        s.expect("250 OK\r\n");
        s.expect("354 Go ahead\r\n");
        s.read_data();
        s.write("250 Queued\r\n");
        s.expect("221 Bye\r\n");
    });

    std::vector<std::string> sent;
    auto& logger = mailsend::log::logger::instance();
    logger.set_callback([&sent](const mailsend::log::entry& e)
    {
        if (e.trace_info && e.trace_info->dir == mailsend::log::direction::send)
            sent.push_back(e.trace_info->data);
    });
    logger.set_trace_enabled(true);

    run_client([&]() -> asio::awaitable<void>
    {
        client cli(co_await asio::this_coro::executor, plain_options());
        co_await cli.connect("127.0.0.1", server.port());
        co_await cli.read_greeting();
        co_await cli.ehlo();
        co_await cli.authenticate("alice", "topsecret");
        co_await cli.send(message("a@example.com", "b@example.com", "Hi", "private body"));
        co_await cli.quit();
    });
    server.join();

    logger.set_trace_enabled(false);
    logger.clear_callback();

    const std::string secret = mailsend::sasl::encode_plain("alice", "topsecret");
    bool auth_redacted = false;
    bool data_summarized = false;
    for (const auto& line : sent)
    {
        BOOST_TEST(line.find(secret) == std::string::npos);
        BOOST_TEST(line.find("private body") == std::string::npos);
        if (line.rfind("AUTH PLAIN <redacted>", 0) == 0)
            auth_redacted = true;
        if (line.rfind("<message data: ", 0) == 0)
            data_summarized = true;
    }
    BOOST_TEST(server.failure() == "");
    BOOST_TEST(auth_redacted);
    BOOST_TEST(data_summarized);
}


BOOST_AUTO_TEST_CASE(trace_hides_login_responses)
{
    // "hunter" encodes to letters only, with nothing in the text marking it as base64.
    const std::string user = mailsend::sasl::encode_login("bob");
    const std::string password = mailsend::sasl::encode_login("hunter");
    BOOST_TEST(password == "aHVudGVy");

    std::vector<std::string> commands;
    mock_server server([&](mock_session& s)
    {
        s.write("220 mock.example.com ESMTP\r\n");
        s.expect(EHLO_REPLY);
        commands.push_back(s.expect("334 VXNlcm5hbWU6\r\n"));
        commands.push_back(s.expect("334 UGFzc3dvcmQ6\r\n"));
        commands.push_back(s.expect("235 2.7.0 Accepted\r\n"));
        s.expect("221 Bye\r\n");
    });

    std::vector<std::string> sent;
    auto& logger = mailsend::log::logger::instance();
    logger.set_callback([&sent](const mailsend::log::entry& e)
    {
        if (e.trace_info && e.trace_info->dir == mailsend::log::direction::send)
            sent.push_back(e.trace_info->data);
    });
    logger.set_trace_enabled(true);

    run_client([&]() -> asio::awaitable<void>
    {
        client cli(co_await asio::this_coro::executor, plain_options());
        co_await cli.connect("127.0.0.1", server.port());
        co_await cli.read_greeting();
        co_await cli.ehlo();
        co_await cli.authenticate("bob", "hunter", smtp::auth_method::login);
        co_await cli.quit();
    });
    server.join();

    logger.set_trace_enabled(false);
    logger.clear_callback();

    BOOST_TEST(server.failure() == "");
    BOOST_REQUIRE_EQUAL(commands.size(), 3u);
    BOOST_TEST(commands[0] == "AUTH LOGIN");
    BOOST_TEST(commands[1] == user);
    BOOST_TEST(commands[2] == password);

    int redacted = 0;
    for (const auto& line : sent)
    {
        BOOST_TEST(line.find(password) == std::string::npos);
        BOOST_TEST(line.find(user) == std::string::npos);
        if (line.rfind("<redacted>", 0) == 0)
            ++redacted;
    }
    BOOST_TEST(redacted == 2);
}


BOOST_AUTO_TEST_CASE(envelope_address_extraction)
{
    BOOST_TEST(client::envelope_address("Alice <alice@example.com>") == "alice@example.com");
    BOOST_TEST(client::envelope_address("  bob@example.com ") == "bob@example.com");
    BOOST_TEST(client::envelope_address("<carol@example.com>") == "carol@example.com");
}


BOOST_AUTO_TEST_CASE(data_terminator)
{
    std::string with_crlf = "line\r\n";
    client::append_smtp_data_terminator(with_crlf);
    BOOST_TEST(with_crlf == "line\r\n.\r\n");

    std::string without_crlf = "line";
    client::append_smtp_data_terminator(without_crlf);
    BOOST_TEST(without_crlf == "line\r\n.\r\n");
}
