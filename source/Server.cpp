#include <charconv>

#include <csignal>
#include <cstdlib>  // for std::getenv
#include <laserpants/dotenv/dotenv.h>
#include <cryptopp/cryptlib.h>

#include <data/async.hpp>
#include <data/net/URL.hpp>
#include <data/net/JSON.hpp>
#include <data/net/HTTP_server.hpp>

#include "Tyche.hpp"
#include "server/server.hpp"

void run (const options &);

void signal_handler (int signal);

template <typename fun, typename ...args>
requires std::regular_invocable<fun, args...>
error catch_all (fun f, args... a) {
    try {
        std::invoke (std::forward<fun> (f), std::forward<args> (a)...);
    } catch (const net::HTTP::exception &x) {
        return error {6, x.what ()};
    } catch (const JSON::exception &x) {
        return error {5, x.what ()};
    } catch (const CryptoPP::Exception &x) {
        return error {4, x.what ()};
    } catch (const exception &x) {
        return error {3, x.what ()};
    } catch (const std::exception &x) {
        return error {2, x.what ()};
    } catch (...) {
        return error {1};
    }

    return error {};
}

int main (int arg_count, char **arg_values) {
    std::signal (SIGINT, signal_handler);
    std::signal (SIGTERM, signal_handler);

    error err = catch_all (run, options {io::arg_parser {arg_count, arg_values}});

    if (bool (err)) {
        if (err.Message) std::cout << "Fail code " << err.Code << ": " << *err.Message << std::endl;
        else std::cout << "Fail code " << err.Code << "." << std::endl;
    }

    return err.Code;

}

boost::asio::io_context IO;

ptr<net::HTTP::server> Server;

std::atomic<bool> Shutdown {false};

void shutdown () {
    if (Shutdown) return;
    std::cout << "\nShut down!" << std::endl;
    Shutdown = true;
    if (Server != nullptr) Server->close ();
}

void signal_handler (int signal) {
    if (signal == SIGINT || signal == SIGTERM) shutdown ();
}

void run (const options &program_options) {

    // path to an env file containing program options.
    auto envpath = program_options.env ();

    // If the user provided a path, it is an error if it is not found.
    // Otherwise we look in the default location but don't throw an
    // error if we don't find it.
    if (bool (envpath)) {
        std::error_code ec;
        if (!std::filesystem::exists (*envpath, ec)) {
            throw exception {} << "file " << *envpath << " does not exist ";
        } else if (ec) {
            throw exception {} << "could not access file " << *envpath;
        }

        dotenv::init (envpath->c_str ());
    } else dotenv::init ();

    net::IP::TCP::endpoint endpoint = program_options.endpoint ();
    if (endpoint.address () != net::IP::address {"127.0.0.1"})
        DATA_LOG (warning) << "listening on " << endpoint << "; this service has no authentication";

    // Every request is answered from the published generation, so
    // one thread for the server is enough. The refresher runs in
    // its own thread.
    uint32 num_threads = program_options.threads ();
    if (num_threads < 1) throw exception {} << "We cannot run with zero threads. There is already one thread running to read this number.";
    if (num_threads > 1) throw exception {} << "We do not do multithreaded yet";

    server handler {program_options};

    // the caches are built before we accept any connections.
    handler.Coordinator->refresh ();
    handler.Coordinator->start ();

    std::cout << "loading server on " << endpoint << std::endl;
    Server = std::make_shared<net::HTTP::server> (IO.get_executor (), endpoint, handler);

    data::spawn (IO.get_executor (), [&] () -> awaitable<void> {
        while (co_await Server->accept ()) {}
        shutdown ();
    });

    while (!Shutdown) IO.run ();

    IO.stop ();

    handler.Coordinator->stop ();
}
