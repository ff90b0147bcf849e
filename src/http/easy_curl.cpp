#include <cumulus/http/easy_curl.h>

#include <stdexcept>
#include <utility>

namespace cumulus
{
namespace http
{

EasyCurl::~EasyCurl()
{
    if (mCurl)
    {
        curl_easy_cleanup(mCurl);
    }
}

EasyCurl::EasyCurl(EasyCurl&& other):
    mCurl(std::exchange(other.mCurl, nullptr))
{}

EasyCurl::EasyCurl():
    mCurl(curl_easy_init())
{
    if (!mCurl)
        throw std::runtime_error("curl_easy_init returns null");
}

EasyCurl& EasyCurl::operator=(EasyCurl&& other)
{
    if (this != &other)
    {
        using std::swap;
        swap(other.mCurl, mCurl);
    }
    return *this;
}

CURL* EasyCurl::curl() const
{
    return mCurl;
}

CurlSList::~CurlSList()
{
    if (mList)
    {
        curl_slist_free_all(mList);
    }
}

void CurlSList::append(const char* line)
{
    auto* list = curl_slist_append(mList, line);

    if (!list)
        throw std::runtime_error("curl_slist_append returns null");

    mList = list;
}

curl_slist* CurlSList::get() const
{
    return mList;
}

} // http
} // cumulus
