/* app.cpp - command line front end.
 *
 * Spinepoint.
 * Copyright (c) 2025 Quin Gillespie.
 * Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:
 * The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */

#include "app.hpp"
#include "constants.hpp"
#include <string>
#include <wx/crt.h>
#include <wx/log.h>

bool app::OnInit() {
	SetAppName(APP_NAME.Lower());
	wxLog::DisableTimestamp();
	if (!wxAppConsole::OnInit()) {
		return false;
	}
	if (!config_mgr.initialize(config_path)) {
		wxLogError("Failed to initialize configuration");
		return false;
	}
	if (config_mgr.get(config_manager::verbose)) {
		wxLog::SetVerbose(true);
	}
	wxLogVerbose("Using configuration %s", config_mgr.get_path());
	return true;
}

int app::OnRun() {
	std::string output;
	const int status = run_locate(request, config_mgr, output);
	if (!output.empty()) {
		wxPrintf("%s", wxString::FromUTF8(output));
	}
	return status;
}

int app::OnExit() {
	config_mgr.shutdown();
	return wxAppConsole::OnExit();
}

void app::OnInitCmdLine(wxCmdLineParser& parser) {
	wxAppConsole::OnInitCmdLine(parser);
	parser.SetLogo(APP_NAME + " " + APP_VERSION + " - " + APP_DESCRIPTION);
	parser.AddSwitch("j", "json", "print the result as JSON");
	parser.AddOption("d", "dialect", "how spine documents are parsed: auto, xml or html");
	parser.AddOption("c", "config", "configuration file to use");
	parser.AddParam("epub", wxCMD_LINE_VAL_STRING);
	parser.AddParam("query", wxCMD_LINE_VAL_STRING);
}

bool app::OnCmdLineParsed(wxCmdLineParser& parser) {
	if (!wxAppConsole::OnCmdLineParsed(parser)) {
		return false;
	}
	request.json_output = parser.Found("j");
	parser.Found("d", &request.dialect_override);
	parser.Found("c", &config_path);
	request.archive_path = parser.GetParam(0);
	request.query = parser.GetParam(1);
	if (request.query.IsEmpty()) {
		wxLogError("The query must not be empty");
		return false;
	}
	return true;
}

wxIMPLEMENT_APP_CONSOLE(app);
