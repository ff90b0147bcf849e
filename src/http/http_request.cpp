#include <algorithm>
#include <cctype>

#include <cumulus/http/http_request.h>

namespace cumulus
{
namespace http
{

const char* toString(HttpMethod method)
{
    switch (method)
    {
    case HM_DELETE:
        return "DELETE";
    case HM_GET:
        return "GET";
    case HM_POST:
        return "POST";
    case HM_PUT:
        return "PUT";
    }

    return "UNKNOWN";
}

bool HeaderNameLess::operator()(const std::string& lhs, const std::string& rhs) const
{
    return std::lexicographical_compare(lhs.begin(),
                                        lhs.end(),
                                        rhs.begin(),
                                        rhs.end(),
                                        [](unsigned char l, unsigned char r) {
                                            return std::tolower(l) < std::tolower(r);
                                        });
}

std::string HttpResponse::header(const std::string& name) const
{
    auto i = mHeaders.find(name);

    if (i != mHeaders.end())
        return i->second;

    return std::string();
}

bool HttpResponse::successful() const
{
    return mStatus >= 200 && mStatus < 300;
}

} // http
} // cumulus
