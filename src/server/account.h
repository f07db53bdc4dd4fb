#ifndef ACCOUNT_H
#define ACCOUNT_H

#include <mutex>
#include <optional>

/* Shared balance of the demo server. Every update happens under one lock. */
class Account {
private:
    mutable std::mutex balance_lock;
    long long balance;

public:
    explicit Account(long long initial_balance = 1000) : balance(initial_balance) {}

    Account(const Account&) = delete;
    Account& operator=(const Account&) = delete;

    long long deposit(long long amount) {
        std::lock_guard<std::mutex> lock(balance_lock);
        balance += amount;
        return balance;
    }

    /* New balance, or nothing when the funds are insufficient. */
    std::optional<long long> withdraw(long long amount) {
        std::lock_guard<std::mutex> lock(balance_lock);
        if (balance < amount) return std::nullopt;
        balance -= amount;
        return balance;
    }

    long long get_balance() const {
        std::lock_guard<std::mutex> lock(balance_lock);
        return balance;
    }
};

#endif // ACCOUNT_H
