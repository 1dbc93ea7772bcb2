/* -*- Mode: C++; tab-width: 4; indent-tabs-mode: t; c-basic-offset: 4 -*- */
/* libmsdoc
 * Version: MPL 2.0 / LGPLv2.1+
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 *
 * For minor contributions see the git repository.
 *
 * Alternatively, the contents of this file may be used under the terms
 * of the GNU Lesser General Public License Version 2.1 or later
 * (LGPLv2.1+), in which case the provisions of the LGPLv2.1+ are
 * applicable instead of those above.
 */

#include <stdio.h>
#include <string.h>
#include <unistd.h>

#include <librevenge/librevenge.h>
#include <librevenge-generators/librevenge-generators.h>
#include <librevenge-stream/librevenge-stream.h>

#include <libmsdoc/libmsdoc.h>

using namespace libmsdoc;

#ifdef HAVE_CONFIG_H
#include "config.h"
#endif

#ifndef VERSION
#define VERSION "UNKNOWN VERSION"
#endif

static int printUsage()
{
	printf("Usage: doc2text [OPTION] <Microsoft Word 97-2003 document>\n");
	printf("\n");
	printf("Options:\n");
	printf("\t-h:                Shows this help message\n");
	printf("\t-r:                Prints the extracted text without using a text generator\n");
	printf("\t-s:                Prints on stderr the way the text was retrieved\n");
	printf("\t-v:                Output doc2text version \n");
	return -1;
}

static int printVersion()
{
	printf("doc2text %s\n", VERSION);
	return 0;
}

static void checkErrorAndPrintMessage(MSDResult error)
{
	if (error == MSD_FILE_ACCESS_ERROR)
		fprintf(stderr, "ERROR: File Exception!\n");
	else if (error == MSD_NO_TEXT_ERROR)
		fprintf(stderr, "ERROR: could not extract text from this file!\n");
	else if (error != MSD_OK)
		fprintf(stderr, "ERROR: Unknown Error!\n");
}

int main(int argc, char *argv[])
{
	bool printHelp=false, printRaw=false, printSource=false;
	int ch;

	while ((ch = getopt(argc, argv, "hrsv")) != -1)
	{
		switch (ch)
		{
		case 'r':
			printRaw=true;
			break;
		case 's':
			printSource=true;
			break;
		case 'v':
			printVersion();
			return 0;
		default:
		case 'h':
			printHelp = true;
			break;
		}
	}
	if (argc != 1+optind || printHelp)
	{
		printUsage();
		return -1;
	}

	librevenge::RVNGFileStream input(argv[optind]);

	MSDConfidence confidence = MSDDocument::isFileFormatSupported(&input);
	if (confidence == MSD_CONFIDENCE_NONE)
	{
		printf("ERROR: Unsupported file format!\n");
		return 1;
	}
	if (confidence == MSD_CONFIDENCE_SUPPORTED_ENCRYPTION)
		fprintf(stderr, "WARNING: Encrypted file, only some raw text can be retrieved!\n");

	librevenge::RVNGString document;
	MSDResult error = MSD_OK;
	if (printRaw || printSource)
	{
		MSDSource source = MSD_SOURCE_NONE;
		error = MSDDocument::extractText(&input, document, &source);
		if (printSource && error == MSD_OK)
			fprintf(stderr, "doc2text: text retrieved %s\n",
			        source == MSD_SOURCE_PIECE_TABLE ? "from the piece table" : "by scanning the file");
	}
	if (!printRaw && error == MSD_OK)
	{
		document.clear();
		librevenge::RVNGTextTextGenerator listenerImpl(document);
		error = MSDDocument::parse(&input, &listenerImpl, argv[optind]);
	}

	checkErrorAndPrintMessage(error);
	if (error != MSD_OK)
		return 1;

	printf("%s", document.cstr());
	if (printRaw)
		printf("\n");

	return 0;
}
/* vim:set shiftwidth=4 softtabstop=4 noexpandtab: */
