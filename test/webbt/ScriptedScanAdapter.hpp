#ifndef WEBBT_TEST_SCRIPTED_SCAN_ADAPTER_HPP_
#define WEBBT_TEST_SCRIPTED_SCAN_ADAPTER_HPP_

#include <string>
#include <memory>
#include <mutex>
#include <initializer_list>

#include <jau/darray.hpp>
#include <jau/ordered_atomic.hpp>

#include <webbt/ScanRecord.hpp>
#include <webbt/ScanAdapter.hpp>

/**
 * ScanAdapter driven by the test thread, counting all startScan() and stopScan() calls.
 * <p>
 * startScan() confirms immediately if `auto_start` is set,
 * otherwise the test calls confirmStart() or failStart().
 * </p>
 * <p>
 * The callbacks of the last concluded startScan() are kept after stopScan(),
 * allowing deliver() to simulate events racing the scan stop.
 * A stopScan() during a pending start drops them, confirmStart() and failStart() are no-ops thereafter.
 * </p>
 */
class ScriptedScanAdapter : public webbt::ScanAdapter {
    private:
        mutable std::mutex mtx;
        bool auto_start;
        bool enabled;
        bool start_concluded;
        candidate_callback_t onCandidate;
        started_callback_t onStarted;
        error_callback_t onError;
        jau::darray<std::string> allowlist;

    public:
        jau::sc_atomic_int startScanCount;
        jau::sc_atomic_int stopScanCount;

        ScriptedScanAdapter(const bool autoStart=true, const bool enabled_=true) noexcept
        : auto_start(autoStart), enabled(enabled_), start_concluded(false), startScanCount(0), stopScanCount(0) {}

        void getEnabled(enabled_callback_t cb) override {
            bool v;
            {
                const std::lock_guard<std::mutex> lock(mtx);
                v = enabled;
            }
            cb(v);
        }

        void startScan(const jau::darray<std::string>& allowlist_,
                       candidate_callback_t onCandidate_,
                       started_callback_t onStarted_,
                       error_callback_t onError_) override
        {
            bool confirm;
            {
                const std::lock_guard<std::mutex> lock(mtx);
                startScanCount++;
                allowlist = allowlist_;
                onCandidate = onCandidate_;
                onStarted = onStarted_;
                onError = onError_;
                confirm = auto_start;
                start_concluded = auto_start;
            }
            if( confirm ) {
                onStarted_();
            }
        }

        void stopScan() override {
            stopScanCount++;
            const std::lock_guard<std::mutex> lock(mtx);
            if( !start_concluded ) {
                // pending start cancelled
                onCandidate = candidate_callback_t();
                onStarted = started_callback_t();
                onError = error_callback_t();
            }
        }

        std::string toString() const noexcept override { return "ScriptedScanAdapter"; }

        jau::darray<std::string> getAllowlist() const {
            const std::lock_guard<std::mutex> lock(mtx);
            return allowlist;
        }

        void confirmStart() {
            started_callback_t cb;
            {
                const std::lock_guard<std::mutex> lock(mtx);
                cb = onStarted;
                start_concluded = true;
            }
            if( !cb.is_null() ) {
                cb();
            }
        }

        void failStart(const std::string& msg) {
            {
                const std::lock_guard<std::mutex> lock(mtx);
                start_concluded = true;
            }
            raiseError(msg);
        }

        void raiseError(const std::string& msg) {
            error_callback_t cb;
            {
                const std::lock_guard<std::mutex> lock(mtx);
                cb = onError;
            }
            if( !cb.is_null() ) {
                cb(msg);
            }
        }

        void deliver(const webbt::ScanRecord& r) {
            candidate_callback_t cb;
            {
                const std::lock_guard<std::mutex> lock(mtx);
                cb = onCandidate;
            }
            if( !cb.is_null() ) {
                cb(r);
            }
        }

        void setEnabled(const bool v) {
            {
                const std::lock_guard<std::mutex> lock(mtx);
                enabled = v;
            }
            sendEnabledChanged(v);
        }
};

typedef std::shared_ptr<ScriptedScanAdapter> ScriptedScanAdapterRef;

inline jau::darray<std::string> strings(std::initializer_list<std::string> l) {
    jau::darray<std::string> res;
    for(const std::string& s : l) {
        res.push_back(s);
    }
    return res;
}

/** Returns a ScanRecord with the given address, name and services, an empty name is not set. */
inline webbt::ScanRecord makeRecord(const std::string& address, const std::string& name,
                                    const jau::darray<std::string>& services)
{
    static uint64_t handle = 0;
    webbt::ScanRecord r(++handle, address);
    if( name.size() > 0 ) {
        r.setName(name);
    }
    for(const std::string& s : services) {
        r.addService(s);
    }
    return r;
}

#endif /* WEBBT_TEST_SCRIPTED_SCAN_ADAPTER_HPP_ */
