/*
 * OllamaCodeGenerator.cpp
 *
 *  Code-generation oracle client: prompt construction, the /api/chat
 *  exchange over libcurl and extraction of the generated body.
 */

#include "../headers/autopo_internal.h"
#include <curl/curl.h>
#include <algorithm>
#include <mutex>

namespace autopo
{
    namespace {
        std::once_flag curlInitialized;

        size_t collectBody(char* data, size_t size, size_t count, void* target)
        {
            static_cast<std::string*>(target)->append(data, size * count);
            return size * count;
        }

        struct CurlHandle
        {
            CURL* handle;
            curl_slist* headers;

            CurlHandle() : handle(nullptr), headers(nullptr)
            {
                std::call_once(curlInitialized, []() { curl_global_init(CURL_GLOBAL_DEFAULT); });
                handle = curl_easy_init();
                if (!handle)
                    throw TransportError("generator", "curl_easy_init failed");
            }
            ~CurlHandle()
            {
                if (headers) curl_slist_free_all(headers);
                curl_easy_cleanup(handle);
            }
            CurlHandle(const CurlHandle&) = delete;
            CurlHandle& operator=(const CurlHandle&) = delete;
        };

        /** GET or POST \a url; returns the response body. Throws TransportError. */
        std::string httpExchange(const std::string& url, const std::string* body, std::chrono::milliseconds timeout)
        {
            CurlHandle curl;
            std::string response;
            curl_easy_setopt(curl.handle, CURLOPT_URL, url.c_str());
            curl_easy_setopt(curl.handle, CURLOPT_WRITEFUNCTION, collectBody);
            curl_easy_setopt(curl.handle, CURLOPT_WRITEDATA, &response);
            curl_easy_setopt(curl.handle, CURLOPT_TIMEOUT_MS, static_cast<long>(timeout.count()));
            curl_easy_setopt(curl.handle, CURLOPT_NOSIGNAL, 1L);
            if (body)
            {
                curl.headers = curl_slist_append(curl.headers, "Content-Type: application/json");
                curl_easy_setopt(curl.handle, CURLOPT_HTTPHEADER, curl.headers);
                curl_easy_setopt(curl.handle, CURLOPT_POST, 1L);
                curl_easy_setopt(curl.handle, CURLOPT_POSTFIELDS, body->c_str());
                curl_easy_setopt(curl.handle, CURLOPT_POSTFIELDSIZE, static_cast<long>(body->size()));
            }

            const CURLcode code = curl_easy_perform(curl.handle);
            if (code != CURLE_OK)
                throw TransportError("generator", url + ": " + curl_easy_strerror(code));

            long status = 0;
            curl_easy_getinfo(curl.handle, CURLINFO_RESPONSE_CODE, &status);
            if (status >= 400)
                throw TransportError("generator", url + " answered HTTP " + std::to_string(status));
            return response;
        }

        std::string trim(const std::string& text)
        {
            const size_t begin = text.find_first_not_of(" \t\r\n");
            if (begin == std::string::npos) return std::string();
            const size_t end = text.find_last_not_of(" \t\r\n");
            return text.substr(begin, end - begin + 1);
        }
    }

    std::string buildCodeGenerationPrompt(const std::string& methodName)
    {
        return
            "You are the System Steward of a self-extending object runtime. Your purpose is to keep the\n"
            "system stable, secure and coherent.\n"
            "Your current task is to write the missing method `" + methodName + "`.\n"
            "\n"
            "LANGUAGE:\n"
            "Methods are written as `def name(self, a, b = 1) { ... }`. Statements end with `;`.\n"
            "Available: let, assignment (= += -= *=), if/else, while, for (x in items), break, continue,\n"
            "return, raise, pass. Expressions: numbers, strings, true, false, null, lists [..],\n"
            "maps {\"key\": value}, + - * / %, comparisons, in, and, or, not.\n"
            "Object state is read and written as `self.name`; `self.get(\"name\", default)` and\n"
            "`self.has(\"name\")` read without failing. Builtins: len str int float bool type abs min max\n"
            "sum round range keys values append join split upper lower contains get put sorted reversed\n"
            "hasattr getattr setattr.\n"
            "\n"
            "CONSTRAINTS:\n"
            "1. Output format: respond with a single JSON object and nothing else.\n"
            "2. JSON structure: the object has exactly one key, \"method_code\", whose value is the\n"
            "   complete source of the method as a string.\n"
            "3. Security: no import, no del, no file, process, environment or network access, no eval,\n"
            "   no names of the form __name__.\n"
            "4. Persistence covenant: if the method changes any `self` attribute, its last statement\n"
            "   MUST be `commit;` (a final `return` may follow it).\n"
            "5. Signature: the first parameter must be `self`.\n"
            "6. Simplicity: keep the code short and robust, and address the mandate directly.\n"
            "\n"
            "Example for `greet(self, name)`:\n"
            "{\"method_code\": \"def greet(self, name) { return \\\"Hello, \\\" + name + \\\"!\\\"; }\"}\n"
            "\n"
            "Example of a state-changing method `set_name(self, new_name)`:\n"
            "{\"method_code\": \"def set_name(self, new_name) { self.name = new_name; commit; }\"}\n"
            "\n"
            "Generate the JSON response for the method `" + methodName + "` now.\n";
    }

    std::string parseCodeFromResponse(const std::string& responseBody)
    {
        try
        {
            const Json::Value response = readJson(responseBody);
            if (!response.isObject() || !response["message"].isObject() || !response["message"]["content"].isString())
            {
                fprintf(stderr, "ERROR: [GENERATOR] response has no message content\n");
                return std::string();
            }
            const std::string content = response["message"]["content"].asString();
            const Json::Value parsed = readJson(content);
            if (!parsed.isObject() || !parsed["method_code"].isString())
            {
                fprintf(stderr, "ERROR: [GENERATOR] 'method_code' missing in: %s\n", content.c_str());
                return std::string();
            }
            const std::string code = trim(parsed["method_code"].asString());
            if (code.empty())
                fprintf(stderr, "ERROR: [GENERATOR] 'method_code' is empty\n");
            return code;
        }
        catch (const std::invalid_argument& e)
        {
            fprintf(stderr, "ERROR: [GENERATOR] cannot decode model response: %s\n", e.what());
            return std::string();
        }
    }

    OllamaCodeGenerator::OllamaCodeGenerator(std::string host, std::string model, std::chrono::milliseconds timeout) :
        host(std::move(host)), model(std::move(model)), timeout(timeout)
    {
        while (!this->host.empty() && this->host.back() == '/')
            this->host.pop_back();
        if (this->host.empty() || this->model.empty())
            throw std::invalid_argument("OllamaCodeGenerator needs a host and a model");
    }

    std::string OllamaCodeGenerator::generate(const GenerationRequest& request)
    {
        Json::Value payload(Json::objectValue);
        payload["model"] = model;
        payload["format"] = "json";
        payload["stream"] = false;
        Json::Value messages(Json::arrayValue);
        Json::Value system(Json::objectValue);
        system["role"] = "system";
        system["content"] = buildCodeGenerationPrompt(request.methodName);
        messages.append(system);
        Json::Value user(Json::objectValue);
        user["role"] = "user";
        user["content"] = request.mandate;
        messages.append(user);
        payload["messages"] = messages;

        const std::string body = writeJson(payload);
        if (diagEnabled())
            fprintf(stderr, "DEBUG: [GENERATOR] %s asking %s for '%s'\n",
                    host.c_str(), model.c_str(), request.methodName.c_str());
        return parseCodeFromResponse(httpExchange(host + "/api/chat", &body, timeout));
    }

    bool OllamaCodeGenerator::ping()
    {
        try
        {
            httpExchange(host + "/api/tags", nullptr, std::min(timeout, std::chrono::milliseconds(5000)));
            return true;
        }
        catch (const TransportError& e)
        {
            fprintf(stderr, "ERROR: [GENERATOR] ping failed: %s\n", e.what());
            return false;
        }
    }
}
