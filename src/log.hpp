#pragma once

#include <chx/log.hpp>
#include <chx/log/chrono.hpp>
#include <chx/media/request.hpp>
#include <chx/media/status_code.hpp>

#include <string>
#include <string_view>

// fd is owned by the backend once set, descriptors above 2 are closed when
// replaced
void set_log_sink(int fd) noexcept(true);
void log_backend(std::string&& str);
// flushes what is queued and stops the writer thread
void terminate_log_backend() noexcept(true);

template <char... Cs, typename... Rs>
void log_info(chx::log::string<Cs...> str, Rs&&... rs) {
    log_backend(chx::log::format(concat(CHXLOG_STR("[%:%F %T:C][Info]"), str),
                                 std::chrono::system_clock::now(),
                                 std::forward<Rs>(rs)...));
}

template <char... Cs, typename... Rs>
void log_norm(chx::log::string<Cs...> str, Rs&&... rs) {
    log_backend(chx::log::format(concat(CHXLOG_STR("[%:%F %T:C][Norm]"), str),
                                 std::chrono::system_clock::now(),
                                 std::forward<Rs>(rs)...));
}

template <char... Cs, typename... Rs>
void log_warn(chx::log::string<Cs...> str, Rs&&... rs) {
    log_backend(chx::log::format(concat(CHXLOG_STR("[%:%F %T:C][Warn]"), str),
                                 std::chrono::system_clock::now(),
                                 std::forward<Rs>(rs)...));
}

template <char... Cs, typename... Rs>
void log_error(chx::log::string<Cs...> str, Rs&&... rs) {
    log_backend(chx::log::format(concat(CHXLOG_STR("[%:%F %T:C][Error]"), str),
                                 std::chrono::system_clock::now(),
                                 std::forward<Rs>(rs)...));
}

template <char... Cs, typename... Rs>
void log_fatal_direct(chx::log::string<Cs...> str, Rs&&... rs) {
    chx::log::fprintf(stderr, concat(CHXLOG_STR("[%:%F %T:C][Fatal]"), str),
                      std::chrono::system_clock::now(),
                      std::forward<Rs>(rs)...);
    terminate_log_backend();
}

void log_norm_resp(const chx::media::request_type& req,
                   chx::media::status_code st);

void log_warn_req(const chx::media::request_type& req,
                  chx::media::status_code st, std::string_view what);
