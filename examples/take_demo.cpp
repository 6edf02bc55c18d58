#include <iostream>
#include <stdexcept>
#include <string>
#include <utility>
#include "takemut/takemut.hpp"

// Connection state that is consumed on every transition
class Connection {
public:
    enum class State { Closed, Open };

    explicit Connection(State s, std::string peer = "") : state_(s), peer_(std::move(peer)) {}
    Connection(Connection&& other) noexcept
        : state_(std::exchange(other.state_, State::Closed)), peer_(std::move(other.peer_)) {}
    Connection& operator=(Connection&& other) noexcept {
        state_ = std::exchange(other.state_, State::Closed);
        peer_ = std::move(other.peer_);
        return *this;
    }

    ~Connection() {
        if (state_ == State::Open) {
            std::cout << "  closing connection to " << peer_ << "\n";
        }
    }

    // Consumes the closed connection
    static Connection open(Connection closed, std::string peer) {
        (void)closed;
        return Connection(State::Open, std::move(peer));
    }

    State state() const { return state_; }
    const std::string& peer() const { return peer_; }

private:
    State state_;
    std::string peer_;
};

// @safe
int main() {
    std::cout << "takemut demo\n\n";

    // take(): consume the old value, produce the new one
    {
        std::cout << "take():\n";
        Connection conn(Connection::State::Closed);
        takemut::take(conn, [](Connection c) {
            return Connection::open(std::move(c), "alpha");
        });
        std::cout << "  open to " << conn.peer() << "\n";

        takemut::take(conn, [](Connection c) {
            std::cout << "  handing over from " << c.peer() << "\n";
            return Connection::open(Connection(Connection::State::Closed), "beta");
        });
        std::cout << "  open to " << conn.peer() << "\n\n";
    }

    // take_no_exit(): a failing transformation leaves None behind
    {
        std::cout << "take_no_exit():\n";
        takemut::Option<int> counter = takemut::Some(5);
        takemut::take_no_exit(counter, [](takemut::Option<int> v) {
            return v.map([](int x) { return x + 1; });
        });
        std::cout << "  counter = " << counter.unwrap_ref() << "\n";

        try {
            takemut::take_no_exit(counter, [](takemut::Option<int> v) -> takemut::Option<int> {
                if (v.unwrap_ref() > 5) {
                    throw std::out_of_range("counter overflow");
                }
                return v;
            });
        } catch (const std::out_of_range& e) {
            std::cout << "  caught: " << e.what() << "\n";
        }
        std::cout << "  counter is " << (counter.is_none() ? "None" : "Some") << "\n";
    }

    return 0;
}
