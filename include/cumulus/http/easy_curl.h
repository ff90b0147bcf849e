#pragma once

#include <curl/curl.h>

namespace cumulus
{
namespace http
{

/**
 * @brief RAII wrapper for libcurl's CURL handle
 *
 * This class is move-only to prevent accidental copying of CURL handles.
 */
class EasyCurl final
{
public:
    /**
     * @brief Cleans up the CURL handle
     */
    ~EasyCurl();

    /**
     * @brief Initializes a CURL handle
     *
     * Throws if libcurl can't provide one.
     */
    EasyCurl();

    EasyCurl(const EasyCurl&) = delete;

    EasyCurl& operator=(const EasyCurl&) = delete;

    explicit EasyCurl(EasyCurl&& other);

    EasyCurl& operator=(EasyCurl&& other);

    /**
     * @brief Get the underlying CURL handle
     * @return Raw pointer to the CURL handle
     */
    CURL* curl() const;

private:
    CURL* mCurl{nullptr}; ///< The underlying libcurl handle
};

/**
 * @brief RAII wrapper for a libcurl header list
 */
class CurlSList final
{
public:
    CurlSList() = default;

    ~CurlSList();

    CurlSList(const CurlSList&) = delete;

    CurlSList& operator=(const CurlSList&) = delete;

    /**
     * @brief Append a "Name: value" line to the list
     *
     * Throws if libcurl couldn't allocate the entry.
     */
    void append(const char* line);

    curl_slist* get() const;

private:
    curl_slist* mList{nullptr};
};

} // http
} // cumulus
