// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "HttpFront.hxx"
#include "Gateway.hxx"
#include "Stats.hxx"
#include "event/Loop.hxx"
#include "thread/Queue.hxx"

#include <event2/buffer.h>
#include <event2/http.h>
#include <event2/keyvalq_struct.h>

#include <fmt/format.h>

#include <cstdint>
#include <cstdlib>
#include <stdexcept>
#include <string>

using std::string_view_literals::operator""sv;

[[gnu::const]]
static HttpMethod
ImportMethod(enum evhttp_cmd_type cmd) noexcept
{
	switch (cmd) {
	case EVHTTP_REQ_GET:
		return HttpMethod::GET;

	case EVHTTP_REQ_HEAD:
		return HttpMethod::HEAD;

	case EVHTTP_REQ_POST:
		return HttpMethod::POST;

	case EVHTTP_REQ_PUT:
		return HttpMethod::PUT;

	case EVHTTP_REQ_DELETE:
		return HttpMethod::DELETE;

	case EVHTTP_REQ_OPTIONS:
		return HttpMethod::OPTIONS;

	case EVHTTP_REQ_PATCH:
		return HttpMethod::PATCH;

	default:
		return HttpMethod::OTHER;
	}
}

static std::string
ImportBody(struct evhttp_request &req)
{
	struct evbuffer *input = evhttp_request_get_input_buffer(&req);
	const std::size_t length = evbuffer_get_length(input);

	std::string body;
	if (length > 0) {
		body.resize(length);
		evbuffer_copyout(input, body.data(), length);
	}

	return body;
}

static GatewayRequest
ImportRequest(struct evhttp_request &req)
{
	GatewayRequest r;
	r.method = ImportMethod(evhttp_request_get_command(&req));

	if (const auto *uri = evhttp_request_get_evhttp_uri(&req)) {
		if (const char *path = evhttp_uri_get_path(uri);
		    path != nullptr && *path != 0)
			r.path = path;
	}

	if (r.path.empty())
		r.path = "/";

	struct evkeyvalq *headers = evhttp_request_get_input_headers(&req);
	if (const char *value = evhttp_find_header(headers, "Authorization"))
		r.authorization = value;

	if (const char *value = evhttp_find_header(headers, "Content-Type"))
		r.content_type = value;

	r.body = ImportBody(req);
	return r;
}

void
HttpRequestJob::Start() noexcept
{
	if (auto *evcon = evhttp_request_get_connection(req))
		evhttp_connection_set_closecb(evcon, CloseCallback, this);

	front.queue.Add(*this);
}

void
HttpRequestJob::Run() noexcept
{
	response = front.gateway.Handle(request, &cancel);
}

void
HttpRequestJob::Done() noexcept
{
	if (req != nullptr) {
		ClearCloseCallback();

		if (evhttp_request_get_connection(req) == nullptr)
			/* the client has disconnected; the request
			   object was detached from the connection and
			   belongs to us now */
			evhttp_request_free(req);
		else if (cancel.IsCancelled())
			/* shutdown: leave the request to evhttp_free() */
			front.logger(4, "Dropping response to ", request.path);
		else {
			front.logger(5, request.path, " ",
				     static_cast<unsigned>(response.status));
			front.SendResponse(*req, response);
		}
	}

	Destroy();
}

void
HttpRequestJob::Abandon() noexcept
{
	cancel.Cancel();

	if (front.queue.Cancel(*this)) {
		if (req != nullptr && evhttp_request_get_connection(req) == nullptr)
			evhttp_request_free(req);

		Destroy();
	}
}

void
HttpRequestJob::Cancel() noexcept
{
	cancel.Cancel();

	if (front.queue.Cancel(*this)) {
		ClearCloseCallback();
		Destroy();
	}
}

inline void
HttpRequestJob::Destroy() noexcept
{
	front.jobs.erase(front.jobs.iterator_to(*this));
	delete this;
}

void
HttpRequestJob::ClearCloseCallback() noexcept
{
	if (req == nullptr)
		return;

	if (auto *evcon = evhttp_request_get_connection(req))
		evhttp_connection_set_closecb(evcon, nullptr, nullptr);
}

void
HttpRequestJob::CloseCallback(struct evhttp_connection *evcon,
			      void *ctx) noexcept
{
	auto &job = *(HttpRequestJob *)ctx;

	evhttp_connection_set_closecb(evcon, nullptr, nullptr);

	if (evhttp_request_get_connection(job.req) != nullptr)
		/* the request is still owned by the connection, and
		   libevent is going to free it */
		job.req = nullptr;

	job.front.logger(4, "Client disconnected: ", job.request.path);
	job.Abandon();
}

HttpFront::HttpFront(EventLoop &event_loop, ThreadQueue &_queue,
		     Gateway &_gateway, Stats &_stats,
		     std::size_t max_body_size, std::chrono::seconds timeout)
	:queue(_queue), gateway(_gateway), stats(_stats),
	 http(evhttp_new(event_loop.Get()))
{
	if (http == nullptr)
		throw std::runtime_error("evhttp_new() failed");

	evhttp_set_allowed_methods(http,
				   EVHTTP_REQ_GET|EVHTTP_REQ_HEAD|
				   EVHTTP_REQ_POST|EVHTTP_REQ_PUT|
				   EVHTTP_REQ_DELETE|EVHTTP_REQ_OPTIONS|
				   EVHTTP_REQ_PATCH);
	evhttp_set_max_body_size(http, max_body_size);
	evhttp_set_timeout(http, static_cast<int>(timeout.count()));
	evhttp_set_gencb(http, RequestCallback, this);
}

HttpFront::~HttpFront() noexcept
{
	CancelAll();
	evhttp_free(http);
}

void
HttpFront::Bind(const char *address)
{
	std::string_view s{address};

	const auto colon = s.rfind(':');
	if (colon == s.npos || colon + 1 == s.size())
		throw std::runtime_error(fmt::format("Port missing in listener address '{}'"sv,
						     s));

	std::string host{s.substr(0, colon)};
	const std::string port_string{s.substr(colon + 1)};

	char *endptr;
	const unsigned long port = std::strtoul(port_string.c_str(), &endptr, 10);
	if (*endptr != 0 || port == 0 || port > 0xffff)
		throw std::runtime_error(fmt::format("Malformed port in listener address '{}'"sv,
						     s));

	if (host.empty() || host == "*"sv)
		host = "0.0.0.0";
	else if (host.size() >= 2 && host.front() == '[' && host.back() == ']')
		host = host.substr(1, host.size() - 2);

	if (evhttp_bind_socket(http, host.c_str(),
			       static_cast<uint16_t>(port)) != 0)
		throw std::runtime_error(fmt::format("Failed to listen on '{}'"sv,
						     s));

	logger(3, "Listening on ", address);
}

void
HttpFront::CancelAll() noexcept
{
	for (auto i = jobs.begin(); i != jobs.end();) {
		/* advance the iterator first, because Cancel() may
		   destroy the job */
		auto &job = *i++;
		job.Cancel();
	}
}

void
HttpFront::OnRequest(struct evhttp_request &req) noexcept
{
	stats.AddRequest();

	HttpRequestJob *job;

	try {
		job = new HttpRequestJob(*this, req, ImportRequest(req));
	} catch (...) {
		logger(1, "Failed to import request: ", std::current_exception());
		evhttp_send_error(&req, HTTP_INTERNAL, nullptr);
		return;
	}

	jobs.push_back(*job);
	job->Start();
}

void
HttpFront::RequestCallback(struct evhttp_request *req, void *ctx) noexcept
{
	auto &front = *(HttpFront *)ctx;
	front.OnRequest(*req);
}

void
HttpFront::SendResponse(struct evhttp_request &req,
			const GatewayResponse &response) noexcept
{
	struct evkeyvalq *headers = evhttp_request_get_output_headers(&req);

	if (!response.content_type.empty())
		evhttp_add_header(headers, "Content-Type",
				  response.content_type.c_str());

	for (const auto &[name, value] : response.headers)
		evhttp_add_header(headers, name.c_str(), value.c_str());

	struct evbuffer *output = evhttp_request_get_output_buffer(&req);
	evbuffer_add(output, response.body.data(), response.body.size());

	evhttp_send_reply(&req, static_cast<int>(response.status),
			  nullptr, nullptr);
}
