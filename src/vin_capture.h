#ifndef VIN_CAPTURE_H
#define VIN_CAPTURE_H

#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

/*
 * vin_capture_session:
 * Decides what to do with the text that a capture front end decodes.
 * Barcode payloads arrive continuously while scanning is active; the first VIN
 * found stops the scan. OCR text arrives one block per captured image.
 *
 * Not thread safe. One session belongs to one capture loop.
 */

enum class capture_source { BARCODE, OCR };
enum class capture_status { INFO, SUCCESS, ERROR };

struct capture_result {
    capture_source source {capture_source::BARCODE};
    capture_status status {capture_status::INFO};
    std::string    candidate {};         // normalized text that was searched
    std::optional<std::string> vin {};   // the VIN, if one was found
    std::string    message {};           // status line for the operator
};

class vin_capture_session {
    vin_capture_session(const vin_capture_session &) = delete;
    vin_capture_session &operator=(const vin_capture_session &) = delete;

    bool     scanning_ {true};
    uint64_t attempts_ {0};
    std::vector<std::string> history_ {}; // newest first
    std::function<void(const std::string &)> detected_ {};

    void record(const std::string &vin);

public:
    static const inline size_t BARCODE_PREVIEW_MIN = 10; // shorter barcode payloads are noise
    static const inline size_t BARCODE_PREVIEW_LEN = 30;
    static const inline size_t OCR_PREVIEW_LEN     = 50;

    vin_capture_session() {}

    void start() { scanning_ = true; }
    void stop()  { scanning_ = false; }
    bool scanning() const { return scanning_; }
    uint64_t attempts() const { return attempts_; }

    /* Register the function called with every detected VIN */
    void on_detected(std::function<void(const std::string &)> fn) { detected_ = std::move(fn); }

    /* Returns std::nullopt if the payload was ignored */
    std::optional<capture_result> submit_barcode(std::string_view text);
    capture_result submit_ocr(std::string_view text);

    const std::vector<std::string> &history() const { return history_; }
    void clear_history() { history_.clear(); }
};

const char *capture_source_name(capture_source source);

#endif
